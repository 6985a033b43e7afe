// file      : libcredtool/failure.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_FAILURE_HXX
#define LIBCREDTOOL_FAILURE_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

namespace credtool
{
  // Credential issuance failure categories.
  //
  // Only rate_limited and transport_failure are retried (within the stage
  // that encountered them). All other kinds require external intervention
  // and are surfaced immediately.
  //
  enum class failure_kind
  {
    key_unavailable,
    signing_failure,
    authentication_rejected,
    scope_insufficient,
    runner_name_conflict,
    rate_limited,
    transport_failure,
    delivery_failure,
    cancelled
  };

  string
  to_string (failure_kind);

  inline ostream&
  operator<< (ostream& os, failure_kind k)
  {
    return os << to_string (k);
  }

  bool
  retryable (failure_kind);

  // Process exit status for the failure kind. Note that 1 is reserved for
  // the invalid usage and configuration errors.
  //
  //  2  key_unavailable
  //  3  signing_failure
  //  4  authentication_rejected
  //  5  scope_insufficient
  //  6  runner_name_conflict
  //  7  rate_limited
  //  8  transport_failure
  //  9  delivery_failure
  // 10  cancelled
  //
  int
  exit_code (failure_kind);

  // Exception thrown by the pipeline stages.
  //
  // The description must never contain secret values (private key, JWT,
  // bearer token, registration token).
  //
  class failure: public runtime_error
  {
  public:
    failure_kind kind;

    // HTTP response status code, if the failure is due to the platform
    // response.
    //
    optional<uint16_t> status;

    // Delay advised by the platform before the next attempt (Retry-After,
    // rate limit reset, etc).
    //
    optional<std::chrono::seconds> retry_after;

    failure (failure_kind k,
             const string& d,
             optional<uint16_t> s = nullopt,
             optional<std::chrono::seconds> ra = nullopt)
        : runtime_error (d), kind (k), status (s), retry_after (ra) {}
  };

  // Print the failure description followed by the HTTP status, if present.
  //
  ostream&
  operator<< (ostream&, const failure&);
}

#endif // LIBCREDTOOL_FAILURE_HXX
