// file      : libcredtool/memory-platform.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/memory-platform.hxx>

#include <libcredtool/jwt.hxx>

using namespace std;
using namespace butl;

namespace credtool
{
  // If there is a fault queued, then remove it from the queue and throw.
  //
  static void
  inject (deque<failure>& fs)
  {
    if (!fs.empty ())
    {
      failure f (move (fs.front ()));
      fs.pop_front ();
      throw f;
    }
  }

  // memory_platform
  //
  bool memory_platform::
  redeem (const string& t)
  {
    auto i (tokens_.find (t));

    if (i == tokens_.end () || i->second.consumed)
      return false;

    i->second.consumed = true;
    active_runners.insert (i->second.runner_name);
    return true;
  }

  bool memory_platform::
  redeemable (const string& t) const
  {
    auto i (tokens_.find (t));
    return i != tokens_.end () && !i->second.consumed;
  }

  // memory_signer
  //
  signed_assertion memory_signer::
  sign (const identity& id, const chrono::seconds& ttl)
  {
    ++calls;
    inject (faults);

    if (ttl <= chrono::seconds::zero () || ttl > max_jwt_validity)
      throw invalid_argument ("invalid assertion validity period " +
                              to_string (ttl.count ()) + "s");

    signed_assertion r (
      jwt_claims (id, clock_.now (), ttl, chrono::seconds::zero ()));

    r.nonce = generate_nonce ();

    // The platform doesn't verify signatures.
    //
    r.token = jwt_token (jwt_message (r), vector<char> {'s', 'i', 'g'});
    return r;
  }

  // memory_token_exchanger
  //
  scoped_access_credential memory_token_exchanger::
  exchange (const signed_assertion& a, const installation_scope& s)
  {
    memory_platform& p (platform_);

    ++p.exchange_calls;
    inject (p.exchange_faults);

    auto reject = [] (const string& d, uint16_t st)
    {
      throw failure (failure_kind::authentication_rejected,
                     "installation access token request rejected: " + d,
                     st);
    };

    // Note that the platform judges by the presented token only.
    //
    signed_assertion c;
    try
    {
      c = jwt_parse (a.token);
    }
    catch (const invalid_argument& e)
    {
      reject (e.what (), 401);
    }

    timestamp now (p.clock_.now ());

    if (c.expires_at <= now)
      reject ("JWT has expired", 401);

    if (c.issued_at > now + chrono::seconds (60))
      reject ("JWT issued in the future", 401);

    if (c.expires_at - c.issued_at > max_jwt_validity)
      reject ("JWT validity period is too long", 401);

    if (c.issuer.empty ())
      reject ("JWT issuer is empty", 401);

    if (!c.nonce.empty () && !p.nonces_.insert (c.nonce).second)
      reject ("JWT has already been presented", 401);

    if (s.installation_id.empty ())
      reject ("unknown installation", 404);

    scoped_access_credential r;
    r.token = "ghs_" + to_string (p.next_id_++) + '_' + generate_nonce ();
    r.expires_at = now + p.credential_validity;
    r.scope = s;
    r.repository_selection = "all";

    p.credentials_[r.token] = r.expires_at;
    return r;
  }

  // memory_runner_token_requester
  //
  runner_registration_token memory_runner_token_requester::
  request_jit_token (const scoped_access_credential& c, const runner_spec& s)
  {
    memory_platform& p (platform_);

    ++p.request_calls;
    inject (p.request_faults);

    timestamp now (p.clock_.now ());

    auto i (p.credentials_.find (c.token));
    if (i == p.credentials_.end () || i->second <= now)
      throw failure (failure_kind::authentication_rejected,
                     "bad credentials",
                     401);

    string sc (to_string (s.scope));

    if (p.permitted_scopes && p.permitted_scopes->count (sc) == 0)
      throw failure (failure_kind::scope_insufficient,
                     "installation has no access to " + sc,
                     403);

    if (p.active_runners.count (s.name) != 0)
      throw failure (failure_kind::runner_name_conflict,
                     "runner '" + s.name + "' already exists in " + sc,
                     409);

    runner_registration_token r;
    r.runner_id = p.next_id_++;
    r.token = "jit_" + to_string (*r.runner_id) + '_' + generate_nonce ();
    r.expires_at = min (now + p.token_validity, c.expires_at);
    r.runner_name = s.name;
    r.labels = s.labels;

    p.tokens_[r.token] = memory_platform::issued_token {s.name, false};
    return r;
  }
}
