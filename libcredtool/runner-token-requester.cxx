// file      : libcredtool/runner-token-requester.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/runner-token-requester.hxx>

#include <libbutl/json/parser.hxx>

using namespace std;
using namespace butl;

namespace credtool
{
  github_runner_token_requester::
  github_runner_token_requester (const github_api& a,
                                 pipeline_clock& c,
                                 const cancellation& cn,
                                 chrono::seconds v,
                                 uint64_t g,
                                 string wf,
                                 const basic_mark* t)
      : api_ (a),
        clock_ (c),
        cancel_ (cn),
        validity_ (v),
        runner_group_id_ (g),
        work_folder_ (move (wf)),
        trace_ (t)
  {
    if (a.timeout <= duration::zero ())
      throw invalid_argument ("non-positive GitHub API timeout");

    if (v <= chrono::seconds::zero ())
      throw invalid_argument ("non-positive registration token validity");
  }

  // Create the just-in-time runner configuration:
  //
  //   POST /orgs/<ORG>/actions/runners/generate-jitconfig
  //   POST /repos/<OWNER>/<REPO>/actions/runners/generate-jitconfig
  //
  // The response contains the runner allocated on the GitHub side (offline
  // until the runner program registers with the encoded configuration) and
  // the base64-encoded configuration itself, to be passed to the runner
  // program with the --jitconfig option.
  //
  runner_registration_token github_runner_token_requester::
  request_jit_token (const scoped_access_credential& c, const runner_spec& rs)
  {
    timestamp now (clock_.now ());

    if (c.expires_at <= now)
      throw failure (failure_kind::authentication_rejected,
                     "installation access token has expired");

    string ep (gh_jit_config_endpoint (rs.scope));

    github_response r (
      github_post (api_,
                   ep,
                   strings {"Authorization: Bearer " + c.token,
                            "Content-Type: application/json"},
                   gh_jit_config_request (rs, runner_group_id_, work_folder_),
                   gh_rate_limit_headers (),
                   cancel_,
                   trace_));

    // Possible response status codes from the generate-jitconfig endpoints:
    //
    // 201 Created
    // 404 Resource not found
    // 409 Conflict (runner with this name already exists)
    // 422 Validation failed, or the endpoint has been spammed.
    //
    if (r.status != 201)
      throw gh_jit_config_failure (r, rs, clock_.now ());

    gh_jit_runner_config jc;
    try
    {
      json::parser p (r.body.data (), r.body.size (), ep);
      jc = gh_jit_runner_config (p);
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
      *trace_ << "jit_runner_config { " << jc << " }";

    if (jc.encoded_jit_config.empty ())
      throw failure (failure_kind::transport_failure,
                     "empty JIT runner configuration in response from " + ep,
                     r.status);

    runner_registration_token t;
    t.token = move (jc.encoded_jit_config);
    t.runner_id = jc.runner.id;
    t.runner_name = move (jc.runner.name);
    t.labels = rs.labels;

    // The token may not outlive the credential it was obtained with.
    //
    t.expires_at = min (now + validity_, c.expires_at);

    return t;
  }

  failure
  gh_jit_config_failure (const github_response& r,
                         const runner_spec& rs,
                         timestamp now)
  {
    string d ("unable to create JIT configuration for runner '" + rs.name +
              "' in " + to_string (rs.scope));

    if (optional<string> m = gh_error_message (r))
      d += ": " + *m;

    optional<chrono::seconds> ra;
    if (gh_rate_limited (r, now, ra))
      return failure (failure_kind::rate_limited, d, r.status, ra);

    switch (r.status)
    {
    case 401: return failure (failure_kind::authentication_rejected,
                              d, r.status);
    case 409: return failure (failure_kind::runner_name_conflict,
                              d, r.status);
    case 403:
    case 404:
    case 422: return failure (failure_kind::scope_insufficient, d, r.status);
    }

    return r.status >= 500
      ? failure (failure_kind::transport_failure, d, r.status)
      : failure (failure_kind::scope_insufficient, d, r.status);
  }
}
