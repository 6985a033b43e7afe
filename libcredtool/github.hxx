// file      : libcredtool/github.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_GITHUB_HXX
#define LIBCREDTOOL_GITHUB_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/diagnostics.hxx>

namespace butl
{
  namespace json
  {
    class parser;
  }
}

namespace credtool
{
  namespace json = butl::json;

  // GitHub REST API endpoint location and request limits.
  //
  struct github_api
  {
    // Note: must end with a slash.
    //
    string url {"https://api.github.com/"};

    // Maximum time for a single request, including the connection setup.
    //
    duration timeout {std::chrono::seconds (30)};
  };

  // GitHub response header name and value. The value is absent if the
  // header is not present.
  //
  struct github_response_header
  {
    string           name;
    optional<string> value;
  };

  using github_response_headers = vector<github_response_header>;

  struct github_response
  {
    uint16_t status = 0;

    // Requested headers with their values, if present.
    //
    github_response_headers headers;

    string body;

    // Return the header value or nullopt if the header is not present or
    // was not requested. The name is case-insensitive.
    //
    optional<string>
    header (const string& name) const;
  };

  // Parse the curl output produced with the --include option: the status
  // line followed by the headers, an empty line, and the body. Skip the
  // interim (1XX) and intermediate (redirect, proxy CONNECT) responses. Save
  // the values of the requested headers. Note that only single-line headers
  // are supported.
  //
  // Throw invalid_argument if unable to parse the status line or headers.
  //
  github_response
  parse_github_response (const string& raw, github_response_headers);

  // Send a POST request to the GitHub API endpoint `ep` and return the
  // response.
  //
  // The endpoint `ep` should not have a leading slash.
  //
  // Pass additional HTTP headers in `hdrs`. For example:
  //
  //   "HeaderName: header value"
  //
  // To retrieve response headers, specify their names in `rsp_hdrs`.
  //
  // Throw failure (transport_failure, cancelled) if unable to obtain the
  // response.
  //
  github_response
  github_post (const github_api&,
               const string& ep,
               const strings& hdrs,
               const string& body,
               const github_response_headers& rsp_hdrs,
               const cancellation&,
               const basic_mark* trace = nullptr);

  // Names of the response headers indicating rate limiting.
  //
  github_response_headers
  gh_rate_limit_headers ();

  // Return true if the response indicates that the request was rate limited
  // (primary or secondary limit) and set retry_after to the advised delay,
  // if determinable.
  //
  bool
  gh_rate_limited (const github_response&,
                   timestamp now,
                   optional<std::chrono::seconds>& retry_after);

  // Return the `message` member of the error response body or nullopt if
  // there is none or the body is not a JSON object.
  //
  optional<string>
  gh_error_message (const github_response&);

  // GitHub request/response types (all start with gh_).
  //

  // Installation access token (IAT) returned when we authenticate as a GitHub
  // app installation.
  //
  struct gh_installation_access_token
  {
    string token;
    timestamp expires_at;
    optional<string> repository_selection;

    explicit
    gh_installation_access_token (json::parser&);

    gh_installation_access_token (string token, timestamp expires_at);

    gh_installation_access_token () = default;
  };

  // The runner member of the JIT runner configuration.
  //
  struct gh_runner
  {
    uint64_t id;
    string name;

    explicit
    gh_runner (json::parser&);

    gh_runner () = default;
  };

  // JIT runner configuration returned by the generate-jitconfig endpoints.
  //
  struct gh_jit_runner_config
  {
    gh_runner runner;
    string encoded_jit_config;

    explicit
    gh_jit_runner_config (json::parser&);

    gh_jit_runner_config () = default;
  };

  // Endpoints (relative to github_api::url).
  //
  string
  gh_access_tokens_endpoint (const installation_scope&);

  string
  gh_jit_config_endpoint (const runner_scope&);

  // Serialize the generate-jitconfig request body.
  //
  string
  gh_jit_config_request (const runner_spec&,
                         uint64_t runner_group_id,
                         const string& work_folder);

  // Throw system_error if the conversion fails due to underlying operating
  // system errors.
  //
  string
  gh_to_iso8601 (timestamp);

  // Throw invalid_argument if the conversion fails due to the invalid
  // argument and system_error if due to underlying operating system errors.
  //
  timestamp
  gh_from_iso8601 (const string&);

  // Note that the secret values are never printed.
  //
  ostream&
  operator<< (ostream&, const gh_installation_access_token&);

  ostream&
  operator<< (ostream&, const gh_runner&);

  ostream&
  operator<< (ostream&, const gh_jit_runner_config&);
}

#endif // LIBCREDTOOL_GITHUB_HXX
