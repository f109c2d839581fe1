#include "core/transport-zone.hxx"

using std::string;
using namespace spanwire;

TransportZoneResolver::TransportZoneResolver(Connection & conn)
  : conn_{conn}
{}

ZoneLookup TransportZoneResolver::resolve(const string & zone_uuid) const
{
  Query q;
  q.uuid(zone_uuid);
  Json res = conn_.queryTransportZones(q);

  ZoneLookup z;
  z.found = extract(res, "result_count", "transport-zone").get<size_t>() >= 1;
  VLOG(1) << "transport zone " << zone_uuid
          << (z.found ? " found" : " not found");
  return z;
}
