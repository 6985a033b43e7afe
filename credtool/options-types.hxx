// file      : credtool/options-types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef CREDTOOL_OPTIONS_TYPES_HXX
#define CREDTOOL_OPTIONS_TYPES_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/fpga.hxx>
#include <libcredtool/delivery.hxx>
#include <libcredtool/credentials.hxx>

#endif // CREDTOOL_OPTIONS_TYPES_HXX
