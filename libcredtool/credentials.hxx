// file      : libcredtool/credentials.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_CREDENTIALS_HXX
#define LIBCREDTOOL_CREDENTIALS_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

namespace credtool
{
  // The App identity the tool authenticates as.
  //
  struct identity
  {
    path private_key;          // PEM-encoded RSA private key.
    string issuer;             // App id.
    optional<string> audience;
  };

  // Signed identity assertion (JWT).
  //
  // Created fresh for every run and presented to the platform only once.
  //
  struct signed_assertion
  {
    string issuer;
    optional<string> audience;
    timestamp issued_at;
    timestamp expires_at;      // issued_at + validity period.
    string nonce;              // Unique per assertion (jti claim).
    string token;              // Compact serialization (secret).
  };

  // Installation the access credential is requested for.
  //
  struct installation_scope
  {
    string installation_id;
  };

  // Installation access token (bearer credential).
  //
  struct scoped_access_credential
  {
    string token;              // Secret.
    timestamp expires_at;
    installation_scope scope;

    // Repository selection granted to the installation ("all" or
    // "selected"), if reported by the platform.
    //
    optional<string> repository_selection;
  };

  // Target the runner is registered with: an organization or a repository.
  //
  // The textual representation is `org/<organization>` or
  // `repo/<owner>/<repository>`.
  //
  class runner_scope
  {
  public:
    enum kind_type {organization, repository};

    kind_type kind = organization;
    string owner;       // Organization or repository owner.
    string repository;  // Empty for the organization scope.

    // Throw invalid_argument if the scope is unresolvable.
    //
    explicit
    runner_scope (const string&);

    runner_scope () = default;
  };

  string
  to_string (const runner_scope&);

  inline ostream&
  operator<< (ostream& os, const runner_scope& s)
  {
    return os << to_string (s);
  }

  // The runner to be registered.
  //
  // The name is expected to be derived from the physical host identity and
  // to be unique across the fleet. The labels are ordered and distinct.
  //
  struct runner_spec
  {
    string name;
    strings labels;
    runner_scope scope;
  };

  // Throw invalid_argument if the name is empty, too long, or contains
  // whitespace or control characters, if there are no labels, or some label
  // is empty or duplicate.
  //
  void
  validate (const runner_spec&);

  // One-time runner registration token (encoded JIT runner configuration).
  //
  struct runner_registration_token
  {
    string token;              // Secret.
    timestamp expires_at;

    optional<uint64_t> runner_id;
    string runner_name;
    strings labels;
  };

  // Note that the secret values are never printed, only their lengths.
  //
  ostream&
  operator<< (ostream&, const signed_assertion&);

  ostream&
  operator<< (ostream&, const scoped_access_credential&);

  ostream&
  operator<< (ostream&, const runner_spec&);

  ostream&
  operator<< (ostream&, const runner_registration_token&);
}

#endif // LIBCREDTOOL_CREDENTIALS_HXX
