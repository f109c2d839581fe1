#ifndef SPANWIRE_COMMON_NET_GLOG
#define SPANWIRE_COMMON_NET_GLOG

#include <string>
#include <glog/logging.h>

namespace spanwire
{
  struct Glog
  {
    static bool initialized;

    //once per process, later calls are ignored
    static void init(std::string service_name);
  };
}

#endif
