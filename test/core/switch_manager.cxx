#include <catch2/catch.hpp>
#include "core/switch-manager.hxx"
#include "core/errors.hxx"
#include "test/core/fake-controller.hxx"

using std::string;
using namespace spanwire;

struct SwitchFixture
{
  SwitchFixture()
  {
    ctl.zones.insert("zone_uuid");
  }

  FakeController ctl;
  AnyNetwork directory;
  TransportZoneResolver zones{ctl};
  ProviderNetworkConfigurator configurator{zones};
  SwitchCapacityManager mgr{ctl, directory, configurator, 0};
  Context ctx{"tid"};
};

/*
 *    switch selection
 */

TEST_CASE_METHOD(SwitchFixture, "unbounded-reuses-sole-switch", "[switch-manager]")
{
  string sw = ctl.addSwitch("net", 250);

  for(int i=0; i<5; ++i)
  {
    SelectedSwitch s = mgr.selectOrCreateSwitch(ctx, "net");
    REQUIRE( s.uuid == sw );
    REQUIRE_FALSE( s.created );
  }
  REQUIRE( ctl.calls.switch_create == 0 );
  REQUIRE( ctl.calls.switch_query == 5 );
}

TEST_CASE_METHOD(SwitchFixture, "no-switch-creates-one", "[switch-manager]")
{
  SelectedSwitch s = mgr.selectOrCreateSwitch(ctx, "net");
  REQUIRE( s.created );
  REQUIRE( ctl.calls.switch_create == 1 );

  const FakeController::Switch *sw = ctl.findSwitch(s.uuid);
  REQUIRE( sw != nullptr );
  REQUIRE( sw->spec.displayName() == "net" );
  REQUIRE( sw->spec.transportZones().empty() );
  REQUIRE( sw->spec.tags().size() == 2 );
  REQUIRE( sw->spec.tags().at(0) == (Tag{scope::Tenant, "tid"}) );
  REQUIRE( sw->spec.tags().at(1) == (Tag{scope::Network, "net"}) );
}

TEST_CASE_METHOD(SwitchFixture, "saturated-switch-spans", "[switch-manager]")
{
  mgr.maxPortsPerSwitch(3);
  string full = ctl.addSwitch("net", 3);

  SelectedSwitch s = mgr.selectOrCreateSwitch(ctx, "net");
  REQUIRE( s.created );
  REQUIRE( s.uuid != full );
  REQUIRE( ctl.calls.switch_create == 1 );
  REQUIRE( ctl.switches.size() == 2 );
}

TEST_CASE_METHOD(SwitchFixture, "first-fit", "[switch-manager]")
{
  mgr.maxPortsPerSwitch(3);
  ctl.addSwitch("net", 3);
  string a = ctl.addSwitch("net", 2);
  ctl.addSwitch("net", 0);

  REQUIRE( mgr.selectOrCreateSwitch(ctx, "net").uuid == a );
  REQUIRE( ctl.calls.switch_create == 0 );
}

TEST_CASE_METHOD(SwitchFixture, "other-networks-ignored", "[switch-manager]")
{
  mgr.maxPortsPerSwitch(3);
  ctl.addSwitch("other", 0);

  SelectedSwitch s = mgr.selectOrCreateSwitch(ctx, "net");
  REQUIRE( s.created );
  REQUIRE( ctl.switch_queries.back().tags().at(0) == (Tag{scope::Network, "net"}) );
}

TEST_CASE_METHOD(SwitchFixture, "unresolved-network-fails", "[switch-manager]")
{
  MissingNetworks missing;
  SwitchCapacityManager m{ctl, missing, configurator, 0};

  REQUIRE_THROWS_AS( m.selectOrCreateSwitch(ctx, "net"), BadNVPState );
  REQUIRE( ctl.calls.switch_create == 0 );
}

TEST_CASE_METHOD(SwitchFixture, "spanned-switch-copies-placement", "[switch-manager]")
{
  mgr.maxPortsPerSwitch(1);
  ctl.addSwitch("net", 1, "public",
                {TransportZoneBinding{"zone_uuid", "bridge", size_t{10}}});

  SelectedSwitch s = mgr.selectOrCreateSwitch(ctx, "net");
  REQUIRE( s.created );

  const FakeController::Switch *sw = ctl.findSwitch(s.uuid);
  REQUIRE( sw != nullptr );
  REQUIRE( sw->spec.displayName() == "public" );
  REQUIRE( sw->spec.transportZones().size() == 1 );
  REQUIRE( sw->spec.transportZones().at(0) ==
           (TransportZoneBinding{"zone_uuid", "bridge", size_t{10}}) );
}

TEST_CASE_METHOD(SwitchFixture, "spanning-onto-a-removed-zone-fails", "[switch-manager]")
{
  mgr.maxPortsPerSwitch(1);
  ctl.addSwitch("net", 1, "public",
                {TransportZoneBinding{"gone", "stt", nullopt}});

  REQUIRE_THROWS_AS( mgr.selectOrCreateSwitch(ctx, "net"),
                     ProviderNetworkError );
  REQUIRE( ctl.calls.switch_create == 0 );
}

TEST_CASE_METHOD(SwitchFixture, "paged-switch-query", "[switch-manager]")
{
  ctl.page_size = 2;
  mgr.maxPortsPerSwitch(1);
  for(int i=0; i<4; ++i) ctl.addSwitch("net", 1);
  string last = ctl.addSwitch("net", 0);

  SwitchCursor c = mgr.lswitchesForNetwork("net");
  REQUIRE( ctl.calls.switch_query == 0 );

  Json res = c.results();
  REQUIRE( res["results"].size() == 5 );
  REQUIRE( ctl.calls.switch_query == 3 );

  //restartable
  REQUIRE( c.results()["results"].size() == 5 );

  REQUIRE( mgr.selectOrCreateSwitch(ctx, "net").uuid == last );
}

/*
 *    network creation and deletion
 */

TEST_CASE_METHOD(SwitchFixture, "create-provider-network", "[switch-manager]")
{
  ProviderNetworkParams p;
  p.phys_net = string{"zone_uuid"};
  p.net_type = string{"vlan"};
  p.segment_id = size_t{47};

  string uuid = mgr.createNetwork(ctx, "net", "public", p);

  const FakeController::Switch *sw = ctl.findSwitch(uuid);
  REQUIRE( sw != nullptr );
  REQUIRE( sw->spec.displayName() == "public" );

  Json j = sw->spec.json();
  REQUIRE( j["transport_zones"][0]["zone_uuid"] == "zone_uuid" );
  REQUIRE( j["transport_zones"][0]["transport_type"] == "bridge" );
  REQUIRE( j["transport_zones"][0]["binding_config"]["vlan_translation"][0]["transport"] == 47 );
}

TEST_CASE_METHOD(SwitchFixture, "create-invalid-network-creates-nothing", "[switch-manager]")
{
  ProviderNetworkParams p;
  p.phys_net = string{"zone_uuid"};
  p.net_type = string{"vlan"};

  REQUIRE_THROWS_AS( mgr.createNetwork(ctx, "net", "public", p),
                     ProviderNetworkError );
  REQUIRE( ctl.calls.switch_create == 0 );
  REQUIRE( ctl.switches.empty() );
}

TEST_CASE_METHOD(SwitchFixture, "delete-network", "[switch-manager]")
{
  ctl.addSwitch("net", 3);
  ctl.addSwitch("net", 1);
  ctl.addSwitch("other", 1);

  REQUIRE( mgr.deleteNetwork("net") == 2 );
  REQUIRE( ctl.calls.switch_delete == 2 );
  REQUIRE( ctl.switches.size() == 1 );
}

TEST_CASE_METHOD(SwitchFixture, "delete-missing-network", "[switch-manager]")
{
  REQUIRE( mgr.deleteNetwork("net") == 0 );
  REQUIRE( ctl.calls.switch_delete == 0 );
}

TEST_CASE_METHOD(SwitchFixture, "delete-network-switch-vanishes", "[switch-manager]")
{
  string a = ctl.addSwitch("net", 0);
  ctl.addSwitch("net", 0);
  ctl.vanishing.insert(a);

  REQUIRE_NOTHROW( mgr.deleteNetwork("net") );
  REQUIRE( ctl.calls.switch_delete == 2 );
  REQUIRE( ctl.switches.empty() );
}
