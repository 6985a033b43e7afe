// file      : libcredtool/token-exchanger.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_TOKEN_EXCHANGER_HXX
#define LIBCREDTOOL_TOKEN_EXCHANGER_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>
#include <libcredtool/github.hxx>
#include <libcredtool/failure.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/diagnostics.hxx>

namespace credtool
{
  // Exchange of the signed identity assertion for the installation-scoped
  // access credential.
  //
  class token_exchanger
  {
  public:
    virtual
    ~token_exchanger () = default;

    // Throw failure (authentication_rejected, rate_limited,
    // transport_failure, cancelled).
    //
    virtual scoped_access_credential
    exchange (const signed_assertion&, const installation_scope&) = 0;
  };

  // Obtain the installation access token (IAT) from GitHub.
  //
  class github_token_exchanger: public token_exchanger
  {
  public:
    // Throw invalid_argument if the API timeout is not positive.
    //
    github_token_exchanger (const github_api&,
                            pipeline_clock&,
                            const cancellation&,
                            const basic_mark* trace = nullptr);

    virtual scoped_access_credential
    exchange (const signed_assertion&, const installation_scope&) override;

  private:
    const github_api& api_;
    pipeline_clock& clock_;
    const cancellation& cancel_;
    const basic_mark* trace_;
  };

  // Map the unsuccessful access_tokens endpoint response to the failure.
  //
  failure
  gh_access_token_failure (const github_response&, timestamp now);

  // Clock drift safety window subtracted from the IAT expiration time.
  //
  const std::chrono::minutes iat_drift_window (5);
}

#endif // LIBCREDTOOL_TOKEN_EXCHANGER_HXX
