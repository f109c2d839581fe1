#include <fmt/format.h>
#include "core/errors.hxx"

using std::string;
using namespace spanwire;

string spanwire::kindName(ProviderError e)
{
  switch(e)
  {
    case ProviderError::None: return "None";
    case ProviderError::ProvidernetParamError: return "ProvidernetParamError";
    case ProviderError::InvalidPhysicalNetworkType:
      return "InvalidPhysicalNetworkType";
    case ProviderError::SegmentIdRequired: return "SegmentIdRequired";
    case ProviderError::SegmentIdUnsupported: return "SegmentIdUnsupported";
    case ProviderError::PhysicalNetworkNotFound:
      return "PhysicalNetworkNotFound";
  }
  return "Unknown";
}

ProviderNetworkError::ProviderNetworkError(ProviderError kind,
                                           const string & what)
  : std::invalid_argument{kindName(kind) + ": " + what},
    kind_{kind}
{}

BadNVPState::BadNVPState(const string & network_id)
  : std::runtime_error{fmt::format(
      "provider details for network {} could not be resolved", network_id)}
{}

AmbiguousPortPlacement::AmbiguousPortPlacement(const string & port_id,
                                               size_t switches)
  : std::runtime_error{fmt::format(
      "port {} resolves to {} logical switches, expected exactly one",
      port_id, switches)},
    switches_{switches}
{}

ControllerError::ControllerError(unsigned short status, const string & what)
  : std::runtime_error{what},
    status_{status}
{}

ControllerNotFound::ControllerNotFound(const string & what)
  : ControllerError{404, what}
{}
