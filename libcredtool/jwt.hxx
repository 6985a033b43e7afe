// file      : libcredtool/jwt.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_JWT_HXX
#define LIBCREDTOOL_JWT_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/credentials.hxx>

namespace credtool
{
  // JSON Web Token (JWT), defined in RFC7519.
  //
  // A JWT is essentially the token issuer's name along with a number of
  // claims, signed with a private key. Note that only GitHub's requirements
  // are implemented, not the entire JWT spec; see the source file for
  // details.
  //
  // Return the base64url-encoded header and payload of the assertion
  // separated with the dot. This is the message the signature is
  // calculated over.
  //
  string
  jwt_message (const signed_assertion&);

  // Return the compact JWT serialization given the message and the binary
  // signature.
  //
  string
  jwt_token (const string& message, const vector<char>& signature);

  // Return the signed assertion claims with the issued at time calculated
  // as now minus backdate (truncated to seconds) and the expiration time as
  // issued at plus the validity period. The nonce and the token members are
  // left empty.
  //
  // The backdate argument specifies the number of seconds to subtract from
  // the "issued at" time in order to combat potential clock drift (which can
  // cause the token to be not valid yet).
  //
  signed_assertion
  jwt_claims (const identity&,
              timestamp now,
              const std::chrono::seconds& validity_period,
              const std::chrono::seconds& backdate);

  // Parse the header and payload of the compact JWT serialization returning
  // the claims (the token member is set to the serialization itself). Note
  // that the signature is not verified, only checked to be present.
  //
  // Throw invalid_argument if the token is malformed.
  //
  signed_assertion
  jwt_parse (const string& token);
}

#endif // LIBCREDTOOL_JWT_HXX
