// file      : libcredtool/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_UTILITY_HXX
#define LIBCREDTOOL_UTILITY_HXX

#include <memory>    // make_shared()
#include <string>    // to_string()
#include <utility>   // move(), forward(), declval(), make_pair()
#include <cassert>   // assert()
#include <iterator>  // make_move_iterator()
#include <algorithm> // *

#include <libbutl/utility.hxx> // icasecmp(), lcase(), throw_generic_error(),
                               // operator<<(ostream, exception)

namespace credtool
{
  using std::move;
  using std::forward;
  using std::declval;

  using std::make_pair;
  using std::make_shared;
  using std::make_move_iterator;
  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::icasecmp;
  using butl::lcase;
  using butl::ucase;
  using butl::throw_generic_error;
}

#include <libcredtool/version.hxx>

#endif // LIBCREDTOOL_UTILITY_HXX
