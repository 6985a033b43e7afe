// file      : libcredtool/jwt.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/jwt.hxx>

#include <libbutl/base64.hxx>
#include <libbutl/json/parser.hxx>
#include <libbutl/json/serializer.hxx>

using namespace std;
using namespace butl;

// The following elements are currently supported:
//
// - The RS256 message authentication code algorithm (RSA with SHA256)
// - The `typ` and `alg` header fields
// - The `iss`, `aud`, `iat`, `exp`, and `jti` claims
//
// A JWT consists of a message and its signature.
//
// The message consists of a base64url-encoded JSON header and payload (set of
// claims). The signature is calculated over the message and then also
// base64url-encoded.
//
// Header:
//
// {
//   "typ": "JWT",
//   "alg": "RS256"
// }
//
// Payload:
//
// {
//   "iss": "123456",
//   "aud": "github",
//   "iat": 1234567,
//   "exp": 1234577,
//   "jti": "f0d2e4b6-3ab6-4d6c-8bc5-4f2aae2e9f3e"
// }
//
// Where:
// iss := Issuer (the App id)
// aud := Audience (optional)
// iat := Issued At (NumericDate: seconds since 1970-01-01T00:00:00Z UTC)
// exp := Expiration Time (NumericDate)
// jti := JWT ID (random nonce, prevents replay)
//
// Signature:
//
//   RSA_SHA256(PKEY, base64url($header) + '.' + base64url($payload))
//
// JWT:
//
//   base64url($header) + '.' + base64url($payload) + '.' + base64url($signature)
//
namespace credtool
{
  static inline uint64_t
  numeric_date (timestamp t)
  {
    using namespace chrono;
    return static_cast<uint64_t> (
      duration_cast<seconds> (t.time_since_epoch ()).count ());
  }

  string
  jwt_message (const signed_assertion& a)
  {
    // Create the header.
    //
    string h; // Header (base64url-encoded).
    {
      vector<char> b;
      json::buffer_serializer s (b, 0 /* indentation */);

      s.begin_object ();
      s.member ("typ", "JWT");
      s.member ("alg", "RS256"); // RSA with SHA256.
      s.end_object ();

      h = base64url_encode (b);
    }

    // Create the payload.
    //
    string p; // Payload (base64url-encoded).
    {
      vector<char> b;
      json::buffer_serializer s (b, 0 /* indentation */);

      s.begin_object ();
      s.member ("iss", a.issuer);

      if (a.audience)
        s.member ("aud", *a.audience);

      s.member ("iat", numeric_date (a.issued_at));
      s.member ("exp", numeric_date (a.expires_at));
      s.member ("jti", a.nonce);
      s.end_object ();

      p = base64url_encode (b);
    }

    return h + '.' + p;
  }

  string
  jwt_token (const string& m, const vector<char>& s)
  {
    return m + '.' + base64url_encode (s);
  }

  signed_assertion
  jwt_claims (const identity& id,
              timestamp now,
              const chrono::seconds& vp,
              const chrono::seconds& bd)
  {
    using namespace chrono;

    signed_assertion r;
    r.issuer = id.issuer;
    r.audience = id.audience;

    // "Issued at" time. Truncate to seconds since that's the NumericDate
    // resolution.
    //
    r.issued_at = timestamp (
      duration_cast<seconds> (now.time_since_epoch () - bd));

    // Expiration time.
    //
    r.expires_at = r.issued_at + vp;

    return r;
  }

  // Decode the base64url-encoded JWT component. Note that the padding is
  // omitted in JWT.
  //
  static vector<char>
  decode_component (const string& s, const char* what)
  {
    string b (s);

    for (char& c: b)
    {
      if      (c == '-') c = '+';
      else if (c == '_') c = '/';
      else if (c == '+' || c == '/' || c == '=')
        throw invalid_argument (string ("invalid JWT ") + what);
    }

    if (b.size () % 4 == 1)
      throw invalid_argument (string ("invalid JWT ") + what);

    b.append ((4 - b.size () % 4) % 4, '=');

    try
    {
      return base64_decode (b);
    }
    catch (const invalid_argument&)
    {
      throw invalid_argument (string ("invalid JWT ") + what);
    }
  }

  signed_assertion
  jwt_parse (const string& t)
  {
    using namespace chrono;
    using event = json::event;

    size_t p1 (t.find ('.'));
    size_t p2 (p1 != string::npos ? t.find ('.', p1 + 1) : string::npos);

    if (p2 == string::npos || t.find ('.', p2 + 1) != string::npos)
      throw invalid_argument ("JWT must consist of three components");

    if (p1 == 0 || p2 == p1 + 1 || p2 + 1 == t.size ())
      throw invalid_argument ("empty JWT component");

    signed_assertion r;

    try
    {
      // Header.
      //
      {
        vector<char> h (decode_component (string (t, 0, p1), "header"));
        json::parser p (h.data (), h.size (), "header");

        optional<string> alg;

        p.next_expect (event::begin_object);
        while (p.next_expect (event::name, event::end_object))
        {
          if (p.name () == "alg")
            alg = p.next_expect_string ();
          else
            p.next_expect_value_skip ();
        }

        if (!alg || *alg != "RS256")
          throw invalid_argument ("unsupported JWT algorithm");
      }

      // Payload.
      //
      {
        vector<char> b (
          decode_component (string (t, p1 + 1, p2 - p1 - 1), "payload"));

        json::parser p (b.data (), b.size (), "payload");

        bool iss (false), iat (false), exp (false);

        p.next_expect (event::begin_object);
        while (p.next_expect (event::name, event::end_object))
        {
          const string& n (p.name ());

          if (n == "iss")
          {
            // GitHub accepts the App id both as a string and as a number.
            //
            p.next_expect (event::string, event::number);
            r.issuer = p.value ();

            iss = true;
          }
          else if (n == "aud")
            r.audience = p.next_expect_string ();
          else if (n == "iat")
          {
            r.issued_at = timestamp (
              seconds (p.next_expect_number<uint64_t> ()));
            iat = true;
          }
          else if (n == "exp")
          {
            r.expires_at = timestamp (
              seconds (p.next_expect_number<uint64_t> ()));
            exp = true;
          }
          else if (n == "jti")
            r.nonce = p.next_expect_string ();
          else
            p.next_expect_value_skip ();
        }

        if (!iss || !iat || !exp)
          throw invalid_argument ("JWT payload is missing iss, iat, or exp");
      }
    }
    catch (const json::invalid_json_input& e)
    {
      throw invalid_argument (string ("invalid JWT: ") + e.what ());
    }

    r.token = t;
    return r;
  }
}
