// file      : libcredtool/failure.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/failure.hxx>

using namespace std;

namespace credtool
{
  string
  to_string (failure_kind k)
  {
    switch (k)
    {
    case failure_kind::key_unavailable:         return "key_unavailable";
    case failure_kind::signing_failure:         return "signing_failure";
    case failure_kind::authentication_rejected: return "authentication_rejected";
    case failure_kind::scope_insufficient:      return "scope_insufficient";
    case failure_kind::runner_name_conflict:    return "runner_name_conflict";
    case failure_kind::rate_limited:            return "rate_limited";
    case failure_kind::transport_failure:       return "transport_failure";
    case failure_kind::delivery_failure:        return "delivery_failure";
    case failure_kind::cancelled:               return "cancelled";
    }

    return string (); // Should never reach.
  }

  bool
  retryable (failure_kind k)
  {
    return k == failure_kind::rate_limited ||
           k == failure_kind::transport_failure;
  }

  int
  exit_code (failure_kind k)
  {
    return static_cast<int> (k) + 2;
  }

  ostream&
  operator<< (ostream& os, const failure& f)
  {
    os << f.what ();

    if (f.status)
      os << " (HTTP status " << *f.status << ')';

    return os;
  }
}
