// file      : libcredtool/memory-platform.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_MEMORY_PLATFORM_HXX
#define LIBCREDTOOL_MEMORY_PLATFORM_HXX

#include <set>
#include <map>
#include <deque>

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>
#include <libcredtool/signer.hxx>
#include <libcredtool/failure.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/token-exchanger.hxx>
#include <libcredtool/runner-token-requester.hxx>

namespace credtool
{
  // In-memory runner platform which allows running the pipeline without
  // network access.
  //
  // The platform accepts any well-formed, not yet expired assertion issued
  // for an installation and hands out access credentials and one-time runner
  // registration tokens. A registration token becomes consumed and its runner
  // active once it is redeemed (see redeem() below). Requesting a token for
  // an active runner name fails with runner_name_conflict.
  //
  class memory_platform
  {
  public:
    explicit
    memory_platform (pipeline_clock& c): clock_ (c) {}

    // Failures to throw instead of serving the subsequent calls, one per
    // call.
    //
    std::deque<failure> exchange_faults;
    std::deque<failure> request_faults;

    // Number of calls made (including the failed ones).
    //
    size_t exchange_calls = 0;
    size_t request_calls = 0;

    // Names of the registered runners that are online.
    //
    std::set<string> active_runners;

    // If present, the runner scopes (in the `org/<org>` or
    // `repo/<owner>/<repo>` form) the installations have access to.
    //
    optional<std::set<string>> permitted_scopes;

    std::chrono::seconds credential_validity {3600};
    std::chrono::seconds token_validity {3600};

    // Redeem the registration token (what the runner does on startup).
    // Return false if the token is unknown or is already consumed.
    //
    bool
    redeem (const string& token);

    // Return true if the token was issued and not redeemed yet.
    //
    bool
    redeemable (const string& token) const;

  private:
    friend class memory_token_exchanger;
    friend class memory_runner_token_requester;

    pipeline_clock& clock_;
    uint64_t next_id_ = 1;

    std::set<string> nonces_;                // Presented assertion nonces.
    std::map<string, timestamp> credentials_; // Access credential expiry.

    struct issued_token
    {
      string runner_name;
      bool consumed;
    };

    std::map<string, issued_token> tokens_;
  };

  class memory_signer: public signer
  {
  public:
    explicit
    memory_signer (pipeline_clock& c): clock_ (c) {}

    virtual signed_assertion
    sign (const identity&, const std::chrono::seconds& ttl) override;

    std::deque<failure> faults;
    size_t calls = 0;

  private:
    pipeline_clock& clock_;
  };

  class memory_token_exchanger: public token_exchanger
  {
  public:
    explicit
    memory_token_exchanger (memory_platform& p): platform_ (p) {}

    virtual scoped_access_credential
    exchange (const signed_assertion&, const installation_scope&) override;

  private:
    memory_platform& platform_;
  };

  class memory_runner_token_requester: public runner_token_requester
  {
  public:
    explicit
    memory_runner_token_requester (memory_platform& p): platform_ (p) {}

    virtual runner_registration_token
    request_jit_token (const scoped_access_credential&,
                       const runner_spec&) override;

  private:
    memory_platform& platform_;
  };
}

#endif // LIBCREDTOOL_MEMORY_PLATFORM_HXX
