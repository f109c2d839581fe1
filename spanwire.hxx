#ifndef SPANWIRE_SPANWIRE_HXX
#define SPANWIRE_SPANWIRE_HXX

/*
 * a top level include file for spanwire
 */

#include "core/driver.hxx"
#include "core/errors.hxx"
#include "core/http-connection.hxx"
#include "common/net/glog.hxx"

#endif
