#ifndef SPANWIRE_CORE_UTIL_HXX
#define SPANWIRE_CORE_UTIL_HXX

#include <string>
#include <vector>
#include <stdexcept>
#include <experimental/optional>
#include <nlohmann/json.hpp>
#include <glog/logging.h>

namespace spanwire {

using Json = nlohmann::json;

template <class T>
using optional = std::experimental::optional<T>;

using std::experimental::nullopt;

// who is asking, every controller object created on behalf of a request is
// tagged with the tenant
struct Context
{
  std::string tenant_id;
};

// tag scopes used to link controller objects back to tenant objects
namespace scope
{
  static const std::string Tenant{"os_tid"};
  static const std::string Network{"neutron_net_id"};
  static const std::string Port{"neutron_port_id"};
}

inline Json extract(const Json & j, std::string tag, std::string context)
{
  auto it = j.find(tag);
  if(it == j.end())
  {
    LOG(ERROR) << j;
    throw std::out_of_range{"error extracting " + context+":"+tag};
  }
  return *it;
}

// returns the value at tag if it exists and is not null
inline optional<Json>
maybeExtract(const Json & j, const std::string & tag)
{
  auto it = j.find(tag);
  if(it == j.end() || it->is_null()) return nullopt;
  return *it;
}

std::string joinStrings(const std::vector<std::string> &, std::string sep);

std::string urlEncode(const std::string &);

}

#endif
