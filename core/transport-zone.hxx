#ifndef SPANWIRE_CORE_TRANSPORT_ZONE_HXX
#define SPANWIRE_CORE_TRANSPORT_ZONE_HXX

#include <string>
#include "core/nvp.hxx"

namespace spanwire
{
  struct ZoneLookup
  {
    bool found{false};
  };

  // live lookup of transport zones by uuid, nothing is cached
  class TransportZoneResolver
  {
    public:
      explicit TransportZoneResolver(Connection &);

      ZoneLookup resolve(const std::string & zone_uuid) const;

    private:
      Connection & conn_;
  };
}

#endif
