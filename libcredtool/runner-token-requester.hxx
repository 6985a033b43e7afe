// file      : libcredtool/runner-token-requester.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_RUNNER_TOKEN_REQUESTER_HXX
#define LIBCREDTOOL_RUNNER_TOKEN_REQUESTER_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>
#include <libcredtool/github.hxx>
#include <libcredtool/failure.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/diagnostics.hxx>

namespace credtool
{
  // Request of the one-time runner registration token.
  //
  // Every call allocates a new runner on the platform side and returns a new
  // token. Tokens are never cached.
  //
  class runner_token_requester
  {
  public:
    virtual
    ~runner_token_requester () = default;

    // Throw failure (authentication_rejected, scope_insufficient,
    // runner_name_conflict, rate_limited, transport_failure, cancelled).
    //
    virtual runner_registration_token
    request_jit_token (const scoped_access_credential&, const runner_spec&) = 0;
  };

  // Obtain the JIT runner configuration from GitHub.
  //
  class github_runner_token_requester: public runner_token_requester
  {
  public:
    // The token validity period is the time the runner has to start and
    // register itself. Throw invalid_argument if the validity period or the
    // API timeout is not positive.
    //
    github_runner_token_requester (
      const github_api&,
      pipeline_clock&,
      const cancellation&,
      std::chrono::seconds validity = std::chrono::seconds (3600),
      uint64_t runner_group_id = 1,
      string work_folder = "_work",
      const basic_mark* trace = nullptr);

    virtual runner_registration_token
    request_jit_token (const scoped_access_credential&,
                       const runner_spec&) override;

  private:
    const github_api& api_;
    pipeline_clock& clock_;
    const cancellation& cancel_;
    std::chrono::seconds validity_;
    uint64_t runner_group_id_;
    string work_folder_;
    const basic_mark* trace_;
  };

  // Map the unsuccessful generate-jitconfig endpoint response to the
  // failure.
  //
  failure
  gh_jit_config_failure (const github_response&,
                         const runner_spec&,
                         timestamp now);
}

#endif // LIBCREDTOOL_RUNNER_TOKEN_REQUESTER_HXX
