// file      : libcredtool/token-exchanger.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/token-exchanger.hxx>

#include <libbutl/json/parser.hxx>

using namespace std;
using namespace butl;

namespace credtool
{
  github_token_exchanger::
  github_token_exchanger (const github_api& a,
                          pipeline_clock& c,
                          const cancellation& cn,
                          const basic_mark* t)
      : api_ (a), clock_ (c), cancel_ (cn), trace_ (t)
  {
    if (a.timeout <= duration::zero ())
      throw invalid_argument ("non-positive GitHub API timeout");
  }

  // There are three types of GitHub API authentication:
  //
  //   1) Authenticating as an app. Used to access parts of the API concerning
  //      the app itself such as getting the list of installations. (Need to
  //      authenticate as an app as part of authenticating as an app
  //      installation.)
  //
  //   2) Authenticating as an app installation (on a user or organisation
  //      account). Used to access resources belonging to the user/repository
  //      or organisation the app is installed in.
  //
  //   3) Authenticating as a user. Used to perform actions as the user.
  //
  // We need to authenticate as an app installation (2) which requires the
  // organization_self_hosted_runners (or, for the repository scope,
  // administration) write permission.
  //
  // The installation access token (IAT), valid for one hour, is passed in
  // the `Authorization` header of the subsequent GitHub API requests:
  //
  //   Authorization: Bearer <INSTALLATION_ACCESS_TOKEN>
  //
  // To obtain an IAT send a POST to
  // /app/installations/<INSTALLATION_ID>/access_tokens which includes the JWT
  // (`Authorization: Bearer <JWT>`).
  //
  scoped_access_credential github_token_exchanger::
  exchange (const signed_assertion& a, const installation_scope& s)
  {
    // An expired assertion is rejected by the platform, so don't bother
    // sending it.
    //
    if (a.expires_at <= clock_.now ())
      throw failure (failure_kind::authentication_rejected,
                     "identity assertion has expired");

    string ep (gh_access_tokens_endpoint (s));

    github_response r (
      github_post (api_,
                   ep,
                   strings {"Authorization: Bearer " + a.token},
                   string () /* body */,
                   gh_rate_limit_headers (),
                   cancel_,
                   trace_));

    // Possible response status codes from the access_tokens endpoint:
    //
    // 201 Created
    // 401 Requires authentication
    // 403 Forbidden
    // 404 Resource not found
    // 422 Validation failed, or the endpoint has been spammed.
    //
    if (r.status != 201)
      throw gh_access_token_failure (r, clock_.now ());

    gh_installation_access_token iat;
    try
    {
      json::parser p (r.body.data (), r.body.size (), ep);
      iat = gh_installation_access_token (p);
    }
    catch (const json::invalid_json_input& e)
    {
      // Note: e.name is the GitHub API endpoint.
      //
      throw failure (failure_kind::transport_failure,
                     "malformed JSON in response from " + e.name +
                     ", line: " + to_string (e.line) +
                     ", column: " + to_string (e.column) +
                     ", error: " + e.what (),
                     r.status);
    }

    if (trace_ != nullptr)
      *trace_ << "installation_access_token { " << iat << " }";

    if (iat.token.empty ())
      throw failure (failure_kind::transport_failure,
                     "empty installation access token in response from " + ep,
                     r.status);

    // Create a clock drift safety window.
    //
    iat.expires_at -= iat_drift_window;

    if (iat.expires_at <= clock_.now ())
      throw failure (failure_kind::authentication_rejected,
                     "installation access token from " + ep +
                     " is already expired",
                     r.status);

    scoped_access_credential c;
    c.token = move (iat.token);
    c.expires_at = iat.expires_at;
    c.scope = s;
    c.repository_selection = move (iat.repository_selection);
    return c;
  }

  failure
  gh_access_token_failure (const github_response& r, timestamp now)
  {
    string d ("unable to get installation access token");

    if (optional<string> m = gh_error_message (r))
      d += ": " + *m;

    optional<chrono::seconds> ra;
    if (gh_rate_limited (r, now, ra))
      return failure (failure_kind::rate_limited, d, r.status, ra);

    if (r.status >= 500)
      return failure (failure_kind::transport_failure, d, r.status);

    // 401 (invalid or expired JWT, wrong issuer), 403, 404 (unknown
    // installation), 422, as well as any other unexpected status.
    //
    return failure (failure_kind::authentication_rejected, d, r.status);
  }
}
