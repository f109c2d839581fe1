#ifndef SPANWIRE_CORE_ERRORS_HXX
#define SPANWIRE_CORE_ERRORS_HXX

#include <string>
#include <stdexcept>

namespace spanwire
{
  // provider network validation -----------------------------------------------

  enum class ProviderError
  {
    None,
    ProvidernetParamError,
    InvalidPhysicalNetworkType,
    SegmentIdRequired,
    SegmentIdUnsupported,
    PhysicalNetworkNotFound
  };

  std::string kindName(ProviderError);

  class ProviderNetworkError : public std::invalid_argument
  {
    public:
      ProviderNetworkError(ProviderError kind, const std::string & what);

      ProviderError kind() const { return kind_; }

    private:
      ProviderError kind_;
  };

  // switch/port placement -----------------------------------------------------

  // the provider context of a network could not be resolved when a switch
  // had to be chosen for it
  struct BadNVPState : public std::runtime_error
  {
    explicit BadNVPState(const std::string & network_id);
  };

  // a port lookup by id landed on zero or more than one logical switch
  class AmbiguousPortPlacement : public std::runtime_error
  {
    public:
      AmbiguousPortPlacement(const std::string & port_id, size_t switches);

      size_t switchCount() const { return switches_; }

    private:
      size_t switches_;
  };

  // controller transport ------------------------------------------------------

  class ControllerError : public std::runtime_error
  {
    public:
      ControllerError(unsigned short status, const std::string & what);

      unsigned short status() const { return status_; }

    private:
      unsigned short status_;
  };

  struct ControllerNotFound : public ControllerError
  {
    explicit ControllerNotFound(const std::string & what);
  };
}

#endif
