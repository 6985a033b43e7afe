// file      : libcredtool/orchestrator.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/orchestrator.hxx>

using namespace std;
using namespace butl;

namespace credtool
{
  string
  to_string (pipeline_state s)
  {
    switch (s)
    {
    case pipeline_state::idle:             return "idle";
    case pipeline_state::signing:          return "signing";
    case pipeline_state::exchanging:       return "exchanging";
    case pipeline_state::requesting_token: return "requesting_token";
    case pipeline_state::delivering:       return "delivering";
    case pipeline_state::done:             return "done";
    case pipeline_state::failed:           return "failed";
    }

    return string (); // Should never reach.
  }

  orchestrator::
  orchestrator (const orchestrator_config& c,
                signer& s,
                token_exchanger& e,
                runner_token_requester& r,
                pipeline_clock& clk,
                const cancellation& cn,
                ostream& o,
                const diag_epilogue& lw,
                uint16_t v)
      : config_ (c),
        signer_ (s),
        exchanger_ (e),
        requester_ (r),
        clock_ (clk),
        cancel_ (cn),
        out_ (o),
        verb_ (v),
        log_writer_ (lw),
        error_mark_ (severity::error, log_writer_),
        warn_ (severity::warning, log_writer_),
        info_ (severity::info, log_writer_),
        trace_ (severity::trace, log_writer_, "orchestrator")
  {
    if (c.app.private_key.empty ())
      throw invalid_argument ("no private key specified");

    if (c.app.issuer.empty ())
      throw invalid_argument ("no App id specified");

    const string& iid (c.installation.installation_id);

    if (iid.empty ())
      throw invalid_argument ("no installation id specified");

    // The id becomes a part of the endpoint URL path.
    //
    if (find_if (iid.begin (), iid.end (),
                 [] (char d) {return d < '0' || d > '9';}) != iid.end ())
      throw invalid_argument ("invalid installation id '" + iid + '\'');

    if (c.jwt_validity <= chrono::seconds::zero () ||
        c.jwt_validity > max_jwt_validity)
      throw invalid_argument (
        "JWT validity period must be between 1 and " +
        to_string (max_jwt_validity.count ()) + " seconds");

    if (c.retry.attempts == 0 || c.retry.attempts > 10)
      throw invalid_argument ("retry attempts must be between 1 and 10");

    if (c.retry.delay < duration::zero () ||
        c.retry.max_delay < c.retry.delay)
      throw invalid_argument ("invalid retry delays");

    validate (c.runner);
  }

  void orchestrator::
  transition (pipeline_state s)
  {
    pipeline_state p (state_);
    state_ = s;

    l1 ([&]{trace_ << p << " -> " << s;});

    if (on_transition)
      on_transition (p, s);
  }

  template <typename F>
  auto orchestrator::
  attempt (F&& f) -> decltype (declval<F> () ())
  {
    return retry (config_.retry,
                  clock_,
                  cancel_,
                  forward<F> (f),
                  [this] (size_t a, const failure& e, duration d)
                  {
                    warn_ << to_string (state_) << " attempt " << a << " of "
                          << config_.retry.attempts << " failed: " << e.kind
                          << ": " << e << ", retrying in "
                          << chrono::duration_cast<chrono::milliseconds> (
                               d).count () << "ms";
                  });
  }

  int orchestrator::
  run ()
  {
    assert (state_ == pipeline_state::idle);

    const runner_spec& rs (config_.runner);

    try
    {
      // Sign.
      //
      transition (pipeline_state::signing);

      signed_assertion a (
        attempt ([this] ()
                 {
                   return signer_.sign (config_.app, config_.jwt_validity);
                 }));

      l2 ([&]{trace_ << "assertion { " << a << " }";});

      // Exchange.
      //
      transition (pipeline_state::exchanging);

      scoped_access_credential c (
        attempt ([this, &a] ()
                 {
                   return exchanger_.exchange (a, config_.installation);
                 }));

      if (c.expires_at > a.expires_at)
      {
        l1 ([&]{trace_ << "access credential expiration clamped to the "
                       << "assertion expiration";});

        c.expires_at = a.expires_at;
      }

      l2 ([&]{trace_ << "access credential { " << c << " }";});

      // Request.
      //
      transition (pipeline_state::requesting_token);

      runner_registration_token t (
        attempt ([this, &c, &rs] ()
                 {
                   return requester_.request_jit_token (c, rs);
                 }));

      if (t.expires_at > c.expires_at)
      {
        l1 ([&]{trace_ << "registration token expiration clamped to the "
                       << "access credential expiration";});

        t.expires_at = c.expires_at;
      }

      l2 ([&]{trace_ << "registration token { " << t << " }";});

      // Deliver.
      //
      // Note that the delivery is never retried so that the token is not
      // handed out twice.
      //
      transition (pipeline_state::delivering);

      if (cancel_.cancelled ())
        throw failure (failure_kind::cancelled, "operation cancelled");

      deliver (t, config_.output, out_, verb_ >= 2 ? &trace_ : nullptr);

      transition (pipeline_state::done);

      l1 ([&]{info_ << "registration token for runner " << rs.name
                    << " delivered to " << config_.output;});

      return 0;
    }
    catch (const failure& e)
    {
      pipeline_state s (state_);

      reason_ = e.kind;
      error_ = e;

      transition (pipeline_state::failed);

      error_mark_ << "unable to register runner " << rs.name << " in "
                  << rs.scope << ": " << e.kind << " while " << s << ": "
                  << e;

      return exit_code (e.kind);
    }
  }
}
