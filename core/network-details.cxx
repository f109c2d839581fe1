#include "core/network-details.hxx"

using std::string;
using namespace spanwire;

// NetworkDetails --------------------------------------------------------------

bool NetworkDetails::empty() const
{
  return !switch_seen &&
    !network_name && !phys_net && !phys_type && !segment_id;
}

ProviderNetworkParams NetworkDetails::providerParams() const
{
  ProviderNetworkParams p;
  if(!phys_net || !phys_type) return p;

  p.phys_net = phys_net;
  if(*phys_type == "bridge" && segment_id)
  {
    p.net_type = netTypeName(NetType::Vlan);
    p.segment_id = segment_id;
  }
  else p.net_type = phys_type;

  return p;
}

Json NetworkDetails::json() const
{
  Json j = Json::object();
  if(network_name) j["network_name"] = *network_name;
  if(phys_net) j["phys_net"] = *phys_net;
  else if(switch_seen) j["phys_net"] = nullptr;
  if(phys_type) j["phys_type"] = *phys_type;
  if(segment_id) j["segment_id"] = *segment_id;
  return j;
}

// NetworkDetailsExtractor -----------------------------------------------------

optional<NetworkDetails>
NetworkDetailsExtractor::extract(const Json & switches, bool located) const
{
  if(!located) return nullopt;

  NetworkDetails d;
  Json results = spanwire::extract(switches, "results", "lswitch-query");
  if(results.empty()) return d;

  const Json & sw = results.at(0);
  d.switch_seen = true;
  if(auto name = maybeExtract(sw, "display_name"))
    d.network_name = name->get<string>();

  auto zones = maybeExtract(sw, "transport_zones");
  if(!zones || zones->empty()) return d;

  TransportZoneBinding b = TransportZoneBinding::fromJson(zones->at(0));
  d.phys_net = b.zone_uuid;
  d.phys_type = b.transport_type;
  d.segment_id = b.vlan_id;
  return d;
}
