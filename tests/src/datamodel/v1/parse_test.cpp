#include <calico/datamodel/v1/keys.hpp>
#include <calico/datamodel/v1/parse.hpp>
#include <calico/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <variant>

namespace v1 = calico::datamodel::v1;

TEST(parse, profile_rules_and_tags) {
  EXPECT_EQ(v1::parse_profile_rules_key("/calico/v1/policy/profile/foo/rules"),
            "foo");
  EXPECT_EQ(v1::parse_profile_tags_key("/calico/v1/policy/profile/foo/tags"),
            "foo");
  EXPECT_FALSE(
      v1::parse_profile_rules_key("/calico/v1/policy/profile/foo/tags"));
  EXPECT_FALSE(
      v1::parse_profile_tags_key("/calico/v1/policy/profile/foo/rules"));
  EXPECT_FALSE(v1::parse_profile_rules_key("/calico/v1/policy/profile//rules"));
  EXPECT_FALSE(v1::parse_profile_rules_key("/calico/v1/policy/profile/foo"));
}

TEST(parse, profile_dir_ignores_trailing_slash) {
  EXPECT_EQ(v1::parse_profile_dir_key("/calico/v1/policy/profile/foo"), "foo");
  EXPECT_EQ(v1::parse_profile_dir_key("/calico/v1/policy/profile/foo/"), "foo");
  EXPECT_EQ(v1::parse_profile_dir_key("/calico/v1/policy/profile/foo//"),
            "foo");
}

TEST(parse, profile_dir_rejects_other_parents) {
  EXPECT_FALSE(v1::parse_profile_dir_key("/calico/v1/policy/profile/foo/rules"));
  EXPECT_FALSE(v1::parse_profile_dir_key("/calico/v1/policy/profile"));
  EXPECT_FALSE(v1::parse_profile_dir_key("/calico/v1/policy/profile/"));
  EXPECT_FALSE(v1::parse_profile_dir_key("/calico/v1/policy/foo"));
  EXPECT_FALSE(v1::parse_profile_dir_key("foo"));
  EXPECT_EQ(v1::parse_profile_rules_key("/calico/v1/policy/profile/foo/rules"),
            "foo");
}

TEST(parse, endpoint_from_config_and_status_roots) {
  auto expected = calico::testing::make_endpoint_id();

  auto live =
      v1::parse_endpoint_key("/calico/v1/host/h1/workload/orc/w1/endpoint/e1");
  ASSERT_TRUE(live.has_value());
  EXPECT_EQ(live->host(), "h1");
  EXPECT_EQ(live->orchestrator(), "orc");
  EXPECT_EQ(live->workload(), "w1");
  EXPECT_EQ(live->endpoint(), "e1");
  EXPECT_EQ(*live, expected);

  auto status = v1::parse_endpoint_key(
      "/calico/felix/v1/host/h1/workload/orc/w1/endpoint/e1");
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, expected);
}

TEST(parse, endpoint_rejects_partial_paths) {
  EXPECT_FALSE(v1::parse_endpoint_key("/calico/v1/host/h1"));
  EXPECT_FALSE(v1::parse_endpoint_key("/calico/v1/host/h1/workload/orc/w1"));
  EXPECT_FALSE(
      v1::parse_endpoint_key("/calico/v1/host/h1/workload/orc/w1/endpoint"));
  EXPECT_FALSE(
      v1::parse_endpoint_key("/calico/v1/host/h1/workload/orc/w1/endpoint/"));
  EXPECT_FALSE(
      v1::parse_endpoint_key("/calico/v1/host//workload/orc/w1/endpoint/e1"));
  EXPECT_FALSE(
      v1::parse_endpoint_key("/calico/v1/host/h1/workloads/orc/w1/endpoint/e1"));
  EXPECT_FALSE(
      v1::parse_endpoint_key("/calico/v1/host/h1/workload/orc/endpoint/e1"));
}

TEST(parse, endpoint_ignores_trailing_path) {
  auto parsed = v1::parse_endpoint_key(
      "/calico/felix/v1/host/h1/workload/orc/w1/endpoint/e1/status");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->endpoint(), "e1");
}

TEST(parse, endpoint_through_pool_shares_fields) {
  auto pool = calico::datamodel::intern_pool{};
  auto first = v1::parse_endpoint_key(
      pool, "/calico/v1/host/h1/workload/orc/w1/endpoint/e1");
  auto second = v1::parse_endpoint_key(
      pool, "/calico/v1/host/h1/workload/orc/w2/endpoint/e2");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(&first->host(), &second->host());
  EXPECT_EQ(&first->orchestrator(), &second->orchestrator());
  EXPECT_NE(&first->workload(), &second->workload());
  EXPECT_EQ(pool.size(), 6u);
  EXPECT_FALSE(v1::parse_endpoint_key(pool, "/calico/v1/host/h1"));
}

TEST(parse, host_ip) {
  EXPECT_EQ(v1::parse_host_ip_key("/calico/v1/host/h1/bird_ip"), "h1");
  EXPECT_FALSE(v1::parse_host_ip_key("/calico/v1/host/h1/config"));
  EXPECT_FALSE(v1::parse_host_ip_key("/calico/felix/v1/host/h1/bird_ip"));
}

TEST(parse, ipam_v4_pool) {
  EXPECT_EQ(v1::parse_ipam_v4_pool_key("/calico/v1/ipam/v4/pool/10.0.0.0-8"),
            "10.0.0.0-8");
  EXPECT_FALSE(v1::parse_ipam_v4_pool_key("/calico/v1/ipam/v4/pool/"));
  EXPECT_FALSE(v1::parse_ipam_v4_pool_key("/calico/v1/ipam/v6/pool/fd00-8"));
}

TEST(parse, hostname_from_status_key) {
  EXPECT_EQ(v1::parse_hostname_from_status_key(
                "/calico/felix/v1/host/h1/workload/orc/w1/endpoint/e1/status"),
            "h1");
  EXPECT_EQ(
      v1::parse_hostname_from_status_key("/calico/felix/v1/host/h1/status"),
      "h1");
  EXPECT_EQ(v1::parse_hostname_from_status_key(v1::make_status_key("h2")),
            "h2");
}

TEST(parse, hostname_from_status_key_requires_root_and_suffix) {
  EXPECT_FALSE(v1::parse_hostname_from_status_key(
      "/calico/felix/v1/host/h1/workload/orc/w1/endpoint/e1"));
  EXPECT_FALSE(
      v1::parse_hostname_from_status_key("/calico/v1/host/h1/status"));
  EXPECT_FALSE(v1::parse_hostname_from_status_key(
      "/calico/felix/v1/host/h1/last_reported_status"));
  EXPECT_FALSE(
      v1::parse_hostname_from_status_key("/calico/felix/v1/host//status"));
  EXPECT_FALSE(v1::parse_hostname_from_status_key("/calico/felix/v1/host"));
}

TEST(parse, hostname_from_status_key_takes_first_segment) {
  EXPECT_EQ(
      v1::parse_hostname_from_status_key("/calico/felix/v1/host/status"),
      "status");
  EXPECT_EQ(v1::parse_hostname_from_status_key(
                "/calico/felix/v1/host/h1/anything/deeper/status"),
            "h1");
  EXPECT_EQ(v1::parse_key("/calico/felix/v1/host/status"),
            v1::parsed_key_t{v1::status_key{.hostname = "status"}});
}

TEST(parse, config_keys_are_exact) {
  EXPECT_EQ(v1::parse_config_key("/calico/v1/config/LogSeverity"),
            "LogSeverity");
  EXPECT_FALSE(v1::parse_config_key("/calico/v1/config/LogSeverity/extra"));
  EXPECT_FALSE(v1::parse_config_key("/calico/v1/config"));

  auto host_config =
      v1::parse_host_config_key("/calico/v1/host/h1/config/LogSeverity");
  ASSERT_TRUE(host_config.has_value());
  EXPECT_EQ(host_config->first, "h1");
  EXPECT_EQ(host_config->second, "LogSeverity");
  EXPECT_FALSE(v1::parse_host_config_key("/calico/v1/host/h1/config"));
}

TEST(parse, host_dir) {
  EXPECT_EQ(v1::parse_host_dir_key("/calico/v1/host/h1"), "h1");
  EXPECT_EQ(v1::parse_host_dir_key("/calico/v1/host/h1/"), "h1");
  EXPECT_FALSE(v1::parse_host_dir_key("/calico/v1/host/h1/bird_ip"));
}

TEST(parse, round_trips_every_key_kind) {
  EXPECT_EQ(v1::parse_host_dir_key(v1::make_host_dir("h1")), "h1");
  EXPECT_EQ(v1::parse_profile_dir_key(v1::make_profile_key("p1")), "p1");
  EXPECT_EQ(v1::parse_profile_rules_key(v1::make_profile_rules_key("p1")),
            "p1");
  EXPECT_EQ(v1::parse_profile_tags_key(v1::make_profile_tags_key("p1")), "p1");
  EXPECT_EQ(v1::parse_config_key(v1::make_config_key("c1")), "c1");
  EXPECT_EQ(v1::parse_host_ip_key(v1::make_host_ip_key("h1")), "h1");
  EXPECT_EQ(v1::parse_ipam_v4_pool_key(v1::make_ipam_v4_pool_key("10.1.0.0-16")),
            "10.1.0.0-16");
  EXPECT_EQ(v1::parse_host_config_key(v1::make_host_config_key("h1", "c1")),
            (std::pair<std::string, std::string>{"h1", "c1"}));

  auto id = calico::testing::make_endpoint_id(7);
  EXPECT_EQ(v1::parse_endpoint_key(v1::make_endpoint_key(
                id.host(), id.orchestrator(), id.workload(), id.endpoint())),
            id);
  EXPECT_EQ(v1::parse_endpoint_key(id.path_for_status()), id);
}

TEST(parse, unrelated_keys_match_nothing) {
  for (const auto key : calico::testing::kUnrelatedKeys) {
    SCOPED_TRACE(std::string{key});
    EXPECT_FALSE(v1::parse_profile_rules_key(key));
    EXPECT_FALSE(v1::parse_profile_tags_key(key));
    EXPECT_FALSE(v1::parse_profile_dir_key(key));
    EXPECT_FALSE(v1::parse_endpoint_key(key));
    EXPECT_FALSE(v1::parse_host_ip_key(key));
    EXPECT_FALSE(v1::parse_ipam_v4_pool_key(key));
    EXPECT_FALSE(v1::parse_hostname_from_status_key(key));
    EXPECT_FALSE(v1::parse_host_dir_key(key));
    EXPECT_FALSE(v1::parse_config_key(key));
    EXPECT_FALSE(v1::parse_host_config_key(key));
    EXPECT_FALSE(v1::parse_key(key));
  }
}

TEST(parse_key, classifies_each_shape) {
  auto endpoint =
      v1::parse_key("/calico/v1/host/h1/workload/orc/w1/endpoint/e1");
  ASSERT_TRUE(endpoint.has_value());
  ASSERT_TRUE(std::holds_alternative<v1::endpoint_id>(*endpoint));
  EXPECT_EQ(std::get<v1::endpoint_id>(*endpoint),
            calico::testing::make_endpoint_id());

  EXPECT_EQ(v1::parse_key("/calico/v1/Ready"),
            v1::parsed_key_t{v1::ready_key{}});
  EXPECT_EQ(v1::parse_key("/calico/openstack/v1/neutron_election"),
            v1::parsed_key_t{v1::neutron_election_key{}});
  EXPECT_EQ(v1::parse_key("/calico/v1/policy/profile/p1"),
            (v1::parsed_key_t{v1::profile_key{
                .profile_id = "p1",
                .resource = v1::profile_resource_t::directory}}));
  EXPECT_EQ(v1::parse_key("/calico/v1/policy/profile/p1/rules"),
            (v1::parsed_key_t{v1::profile_key{
                .profile_id = "p1", .resource = v1::profile_resource_t::rules}}));
  EXPECT_EQ(v1::parse_key("/calico/v1/policy/profile/p1/tags"),
            (v1::parsed_key_t{v1::profile_key{
                .profile_id = "p1", .resource = v1::profile_resource_t::tags}}));
  EXPECT_EQ(v1::parse_key("/calico/v1/host/h1"),
            v1::parsed_key_t{v1::host_key{.hostname = "h1"}});
  EXPECT_EQ(v1::parse_key("/calico/v1/host/h1/bird_ip"),
            v1::parsed_key_t{v1::host_ip_key{.hostname = "h1"}});
  EXPECT_EQ(v1::parse_key("/calico/v1/host/h1/config/c1"),
            (v1::parsed_key_t{v1::config_key{.hostname = "h1", .name = "c1"}}));
  EXPECT_EQ(v1::parse_key("/calico/v1/config/c1"),
            (v1::parsed_key_t{
                v1::config_key{.hostname = std::nullopt, .name = "c1"}}));
  EXPECT_EQ(v1::parse_key("/calico/v1/ipam/v4/pool/10.0.0.0-8"),
            v1::parsed_key_t{v1::ipam_v4_pool_key{.encoded_cidr = "10.0.0.0-8"}});
  EXPECT_EQ(v1::parse_key("/calico/felix/v1/host/h1/status"),
            v1::parsed_key_t{v1::status_key{.hostname = "h1"}});
  EXPECT_EQ(v1::parse_key("/calico/felix/v1/host/h1/last_reported_status"),
            v1::parsed_key_t{v1::status_key{.hostname = "h1"}});
}

TEST(parse_key, endpoint_status_leaf_is_an_endpoint) {
  auto parsed = v1::parse_key(
      "/calico/felix/v1/host/h1/workload/orc/w1/endpoint/e1/status");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(std::holds_alternative<v1::endpoint_id>(*parsed));
}

TEST(parse_key, unknown_shapes_under_known_roots) {
  EXPECT_FALSE(v1::parse_key("/calico/v1/host/h1/config"));
  EXPECT_FALSE(v1::parse_key("/calico/v1/policy"));
  EXPECT_FALSE(v1::parse_key("/calico/felix/v1/host/h1"));
}
