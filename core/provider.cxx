#include <fmt/format.h>
#include "core/provider.hxx"

using std::string;
using std::move;

using namespace spanwire;

// NetType ---------------------------------------------------------------------

optional<NetType> spanwire::parseNetType(const string & s)
{
  if(s == "flat") return NetType::Flat;
  if(s == "vlan") return NetType::Vlan;
  if(s == "gre") return NetType::Gre;
  if(s == "stt") return NetType::Stt;
  if(s == "local") return NetType::Local;
  if(s == "bridge") return NetType::Bridge;
  return nullopt;
}

string spanwire::netTypeName(NetType t)
{
  switch(t)
  {
    case NetType::Flat: return "flat";
    case NetType::Vlan: return "vlan";
    case NetType::Gre: return "gre";
    case NetType::Stt: return "stt";
    case NetType::Local: return "local";
    case NetType::Bridge: return "bridge";
  }
  return "unknown";
}

string spanwire::transportType(NetType t)
{
  switch(t)
  {
    // vlans ride a bridge zone tagged with the vlan id
    case NetType::Flat:
    case NetType::Vlan:
    case NetType::Bridge: return "bridge";
    case NetType::Gre: return "gre";
    case NetType::Stt: return "stt";
    case NetType::Local: return "local";
  }
  return "unknown";
}

// ProviderNetworkParams -------------------------------------------------------

bool ProviderNetworkParams::empty() const
{
  return !phys_net && !net_type && !segment_id;
}

Json ProviderNetworkParams::json() const
{
  Json j = Json::object();
  if(phys_net) j["phys-net"] = *phys_net;
  if(net_type) j["net-type"] = *net_type;
  if(segment_id) j["segment-id"] = *segment_id;
  return j;
}

ProviderNetworkParams ProviderNetworkParams::fromJson(const Json & j)
{
  ProviderNetworkParams p;
  if(auto x = maybeExtract(j, "phys-net")) p.phys_net = x->get<string>();
  if(auto x = maybeExtract(j, "net-type")) p.net_type = x->get<string>();
  if(auto x = maybeExtract(j, "segment-id")) p.segment_id = x->get<size_t>();
  return p;
}

// ProviderNetworkConfigurator -------------------------------------------------

ProviderNetworkConfigurator::ProviderNetworkConfigurator(
    const TransportZoneResolver & zones)
  : zones_{zones}
{}

static ProviderCheck fail(ProviderError e, string msg)
{
  ProviderCheck c;
  c.error = e;
  c.message = move(msg);
  return c;
}

ProviderCheck
ProviderNetworkConfigurator::validate(const ProviderNetworkParams & p) const
{
  //private network, left unbound
  if(!p.phys_net && !p.net_type) return ProviderCheck{};

  if(!p.phys_net || !p.net_type)
    return fail(ProviderError::ProvidernetParamError,
                "both or neither of phys_net and net_type are required");

  optional<NetType> t = parseNetType(*p.net_type);
  if(!t)
    return fail(ProviderError::InvalidPhysicalNetworkType,
                fmt::format("unknown network type '{}'", *p.net_type));

  if(*t == NetType::Vlan && !p.segment_id)
    return fail(ProviderError::SegmentIdRequired,
                "vlan networks require a segment id");

  if(*t != NetType::Vlan && p.segment_id)
    return fail(ProviderError::SegmentIdUnsupported,
                fmt::format("{} networks do not take a segment id",
                            netTypeName(*t)));

  if(!zones_.resolve(*p.phys_net).found)
    return fail(ProviderError::PhysicalNetworkNotFound,
                fmt::format("physical network {} not found", *p.phys_net));

  ProviderCheck c;
  TransportZoneBinding b;
  b.zone_uuid = *p.phys_net;
  b.transport_type = transportType(*t);
  if(*t == NetType::Vlan) b.vlan_id = p.segment_id;
  c.binding = b;
  return c;
}

void ProviderNetworkConfigurator::configure(
    LSwitch & sw, const ProviderNetworkParams & p) const
{
  ProviderCheck c = validate(p);
  if(!c.ok())
  {
    LOG(WARNING) << "rejecting provider network config "
                 << p.json() << ": " << c.message;
    throw ProviderNetworkError{c.error, c.message};
  }

  if(!c.binding) return;

  const TransportZoneBinding & b = *c.binding;
  sw.transportZone(b.zone_uuid, b.transport_type, b.vlan_id);
}

void ProviderNetworkConfigurator::configure(LSwitch & sw,
                                            optional<string> phys_net,
                                            optional<string> net_type,
                                            optional<size_t> segment_id) const
{
  ProviderNetworkParams p;
  p.phys_net = move(phys_net);
  p.net_type = move(net_type);
  p.segment_id = segment_id;
  configure(sw, p);
}
