#include "glog.hxx"

using namespace spanwire;
using std::string;

bool Glog::initialized{false};

void Glog::init(string service_name)
{
  if(initialized) return;

  //InitGoogleLogging keeps the pointer, not a copy
  static string name;
  name = service_name;

  google::InitGoogleLogging(name.c_str());
  google::InstallFailureSignalHandler();
  Glog::initialized = true;
}
