// file      : tests/pipeline/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <set>
#include <sstream>
#include <iostream>

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/jwt.hxx>
#include <libcredtool/clock.hxx>
#include <libcredtool/failure.hxx>
#include <libcredtool/delivery.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/diagnostics.hxx>
#include <libcredtool/orchestrator.hxx>
#include <libcredtool/memory-platform.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace credtool;

using std::chrono::seconds;

static orchestrator_config
config ()
{
  orchestrator_config r;
  r.app.private_key = path ("test-key.pem");
  r.app.issuer = "app-123";
  r.installation.installation_id = "40993215";
  r.runner.name = "fpga-runner-07";
  r.runner.labels = strings {"fpga", "caliptra"};
  r.runner.scope = runner_scope ("org/caliptra-sw");
  return r;
}

// The test environment: in-memory platform with the pipeline stages and the
// collected diagnostics.
//
struct environment
{
  manual_clock clock;
  cancellation cancel;

  memory_platform platform {clock};
  memory_signer signer {clock};
  memory_token_exchanger exchanger {platform};
  memory_runner_token_requester requester {platform};

  ostringstream out;
  ostringstream log;

  diag_epilogue log_writer {[this] (diag_data&& d) {write_diag (log, d);}};

  vector<pipeline_state> states;

  int
  run (const orchestrator_config& c, uint16_t verbosity = 0)
  {
    orchestrator o (c,
                    signer,
                    exchanger,
                    requester,
                    clock,
                    cancel,
                    out,
                    log_writer,
                    verbosity);

    o.on_transition = [this] (pipeline_state p, pipeline_state n)
    {
      assert (p != n);
      states.push_back (n);
    };

    int r (o.run ());

    assert (o.state () == (r == 0
                           ? pipeline_state::done
                           : pipeline_state::failed));

    assert (r == 0
            ? !o.reason ()
            : o.reason () && exit_code (*o.reason ()) == r);

    return r;
  }

  // Return the token written to the output stripping the trailing newline.
  //
  string
  token () const
  {
    string r (out.str ());
    assert (!r.empty () && r.back () == '\n');
    r.pop_back ();
    return r;
  }
};

static bool
invalid_config (const orchestrator_config& c)
{
  environment e;

  try
  {
    orchestrator o (c,
                    e.signer,
                    e.exchanger,
                    e.requester,
                    e.clock,
                    e.cancel,
                    e.out,
                    e.log_writer);
    return false;
  }
  catch (const invalid_argument&)
  {
    return true;
  }
}

int
main ()
{
  using ps = pipeline_state;

  // Successful registration.
  //
  {
    environment e;

    assert (e.run (config (), 2 /* verbosity */) == 0);

    assert ((e.states == vector<ps> {ps::signing,
                                     ps::exchanging,
                                     ps::requesting_token,
                                     ps::delivering,
                                     ps::done}));

    string t (e.token ());
    assert (!t.empty ());

    assert (e.platform.exchange_calls == 1);
    assert (e.platform.request_calls == 1);

    // The secrets are not traced even at the higher verbosity.
    //
    string l (e.log.str ());
    assert (l.find ("requesting_token -> delivering") != string::npos);
    assert (l.find (t) == string::npos);
    assert (l.find ("ghs_") == string::npos);

    // The runner redeems the token once.
    //
    assert (e.platform.redeem (t));
    assert (!e.platform.redeem (t));
    assert (e.platform.active_runners.count ("fpga-runner-07") == 1);
  }

  // Name conflict.
  //
  {
    environment e;
    e.platform.active_runners.insert ("fpga-runner-07");

    assert (e.run (config ()) == 6);

    assert ((e.states == vector<ps> {ps::signing,
                                     ps::exchanging,
                                     ps::requesting_token,
                                     ps::failed}));

    assert (e.out.str ().empty ());
    assert (e.platform.request_calls == 1); // Not retried.

    string l (e.log.str ());
    assert (l.find ("error: ") == 0);
    assert (l.find ("runner_name_conflict") != string::npos);
    assert (l.find ("requesting_token") != string::npos);
    assert (l.find ("fpga-runner-07") != string::npos);
    assert (l.find ("HTTP status 409") != string::npos);
    assert (l.find ("ghs_") == string::npos);
    assert (l.find ("test-key.pem") == string::npos);
    assert (l.find ("PRIVATE KEY") == string::npos);
  }

  // Re-registration after the crash: the first token is redeemed and the
  // runner is online, so the name is taken. The new request is rejected
  // rather than the name silently changed.
  //
  {
    environment e;

    assert (e.run (config ()) == 0);
    assert (e.platform.redeem (e.token ()));

    e.out.str ("");
    e.states.clear ();

    assert (e.run (config ()) == 6);
    assert (e.out.str ().empty ());
    assert (e.states.back () == ps::failed);
  }

  // Two requests for the same runner with a still valid credential yield
  // distinct tokens, none outliving the credential. A redeemed token cannot
  // be redeemed again.
  //
  {
    environment e;
    orchestrator_config c (config ());

    signed_assertion a (e.signer.sign (c.app, seconds (600)));
    assert (a.expires_at == a.issued_at + seconds (600));

    scoped_access_credential ac (e.exchanger.exchange (a, c.installation));
    assert (!ac.token.empty () && ac.expires_at > e.clock.now ());

    runner_registration_token t1 (
      e.requester.request_jit_token (ac, c.runner));

    runner_registration_token t2 (
      e.requester.request_jit_token (ac, c.runner));

    assert (!t1.token.empty () && !t2.token.empty ());
    assert (t1.token != t2.token);
    assert (t1.runner_id != t2.runner_id);
    assert (t1.runner_name == "fpga-runner-07");
    assert (t1.labels == c.runner.labels);
    assert (t1.expires_at <= ac.expires_at);

    assert (e.platform.redeemable (t1.token));
    assert (e.platform.redeem (t1.token));
    assert (!e.platform.redeemable (t1.token));
    assert (!e.platform.redeem (t1.token));
    assert (!e.platform.redeem ("unknown"));

    // The same assertion cannot be presented twice.
    //
    try
    {
      e.exchanger.exchange (a, c.installation);
      assert (false);
    }
    catch (const failure& f)
    {
      assert (f.kind == failure_kind::authentication_rejected);
    }
  }

  // Exchanging an expired assertion is rejected, never yielding an empty
  // credential.
  //
  {
    environment e;
    orchestrator_config c (config ());

    signed_assertion a (e.signer.sign (c.app, seconds (60)));
    e.clock.advance (seconds (61));

    try
    {
      e.exchanger.exchange (a, c.installation);
      assert (false);
    }
    catch (const failure& f)
    {
      assert (f.kind == failure_kind::authentication_rejected);
      assert (string (f.what ()).find (a.token) == string::npos);
    }

    assert (e.platform.exchange_calls == 1);
  }

  {
    environment e;
    orchestrator_config c (config ());
    c.jwt_validity = seconds (60);

    orchestrator o (c,
                    e.signer,
                    e.exchanger,
                    e.requester,
                    e.clock,
                    e.cancel,
                    e.out,
                    e.log_writer);

    // Stall between the signing and the exchange.
    //
    o.on_transition = [&e] (pipeline_state, pipeline_state n)
    {
      if (n == ps::exchanging)
        e.clock.advance (seconds (120));
    };

    assert (o.run () == 4);
    assert (o.state () == ps::failed);
    assert (o.reason () == failure_kind::authentication_rejected);
    assert (e.platform.exchange_calls == 1); // Not retried.
    assert (e.platform.request_calls == 0);
    assert (e.out.str ().empty ());
  }

  // Insufficient scope.
  //
  {
    environment e;
    e.platform.permitted_scopes = std::set<string> {"org/chipsalliance"};

    assert (e.run (config ()) == 5);
    assert (e.log.str ().find ("scope_insufficient") != string::npos);
    assert (e.out.str ().empty ());
  }

  // Unavailable key.
  //
  {
    environment e;
    e.signer.faults.push_back (
      failure (failure_kind::key_unavailable,
               "private key test-key.pem: file does not exist"));

    assert (e.run (config ()) == 2);
    assert ((e.states == vector<ps> {ps::signing, ps::failed}));
    assert (e.platform.exchange_calls == 0);
  }

  // Signing timeout is a transport failure and is retried.
  //
  {
    environment e;
    e.signer.faults.push_back (
      failure (failure_kind::transport_failure, "openssl execution timeout"));

    assert (e.run (config ()) == 0);
    assert (e.signer.calls == 2);
    assert (e.clock.sleeps.size () == 1);
    assert (e.log.str ().find ("warning: signing attempt 1 of 4 failed") !=
            string::npos);
  }

  // Cancellation before the pipeline starts and in the middle of it.
  //
  {
    environment e;
    e.cancel.cancel ();

    assert (e.run (config ()) == 10);
    assert ((e.states == vector<ps> {ps::signing, ps::failed}));
    assert (e.signer.calls == 0);
  }

  {
    environment e;
    orchestrator_config c (config ());

    orchestrator o (c,
                    e.signer,
                    e.exchanger,
                    e.requester,
                    e.clock,
                    e.cancel,
                    e.out,
                    e.log_writer);

    vector<ps> states;
    o.on_transition = [&e, &states] (pipeline_state, pipeline_state n)
    {
      states.push_back (n);

      if (n == ps::requesting_token)
        e.cancel.cancel ();
    };

    assert (o.run () == 10);
    assert (o.reason () == failure_kind::cancelled);

    assert ((states == vector<ps> {ps::signing,
                                   ps::exchanging,
                                   ps::requesting_token,
                                   ps::failed}));

    assert (e.platform.request_calls == 0);
    assert (e.out.str ().empty ());
  }

  // Cancellation while backing off.
  //
  {
    environment e;
    e.platform.request_faults.push_back (
      failure (failure_kind::transport_failure, "connection refused"));

    e.clock.on_sleep = [&e] (duration) {e.cancel.cancel ();};

    assert (e.run (config ()) == 10);
    assert (e.platform.request_calls == 1);
  }

  // The configuration is owned by the orchestrator, so changing or
  // destroying the caller's copy doesn't affect the run.
  //
  {
    environment e;

    unique_ptr<orchestrator_config> c (new orchestrator_config (config ()));

    orchestrator o (*c,
                    e.signer,
                    e.exchanger,
                    e.requester,
                    e.clock,
                    e.cancel,
                    e.out,
                    e.log_writer);

    c->runner.name.clear ();
    c->retry.attempts = 0;
    c.reset ();

    assert (o.run () == 0);
    assert (e.platform.redeem (e.token ()));
    assert (e.platform.active_runners.count ("fpga-runner-07") == 1);
  }

  // Unwritable standard output.
  //
  {
    environment e;
    orchestrator_config c (config ());

    ostream out (nullptr);

    orchestrator o (c,
                    e.signer,
                    e.exchanger,
                    e.requester,
                    e.clock,
                    e.cancel,
                    out,
                    e.log_writer);

    assert (o.run () == 9);
    assert (o.state () == ps::failed);
    assert (o.reason () == failure_kind::delivery_failure);
    assert (e.log.str ().find ("unable to write token to stdout") !=
            string::npos);
  }

  // Delivery failure.
  //
  {
    environment e;
    orchestrator_config c (config ());
    c.output = destination ("file:/nonexistent-credtool-dir/token");

    assert (e.run (c) == 9);

    assert ((e.states == vector<ps> {ps::signing,
                                     ps::exchanging,
                                     ps::requesting_token,
                                     ps::delivering,
                                     ps::failed}));

    assert (e.log.str ().find ("delivery_failure") != string::npos);
  }

  // Expiration times are clamped along the chain.
  //
  {
    environment e;

    assert (e.run (config (), 1 /* verbosity */) == 0);

    string l (e.log.str ());
    assert (l.find ("access credential expiration clamped") != string::npos);
    assert (l.find ("registration token delivered") == string::npos);
    assert (l.find ("delivered to stdout") != string::npos);
  }

  // Invalid configurations.
  //
  {
    assert (!invalid_config (config ()));

    orchestrator_config c (config ());
    c.runner.name.clear ();
    assert (invalid_config (c));

    c = config ();
    c.runner.labels.clear ();
    assert (invalid_config (c));

    c = config ();
    c.runner.scope = runner_scope ();
    assert (invalid_config (c));

    c = config ();
    c.app.private_key = path ();
    assert (invalid_config (c));

    c = config ();
    c.app.issuer.clear ();
    assert (invalid_config (c));

    c = config ();
    c.installation.installation_id.clear ();
    assert (invalid_config (c));

    // The installation id is a part of the endpoint path.
    //
    for (const char* id: {"../../orgs/x", "123/../456", "12a", "-1", " 1"})
    {
      c = config ();
      c.installation.installation_id = id;
      assert (invalid_config (c));
    }

    c = config ();
    c.jwt_validity = seconds (0);
    assert (invalid_config (c));

    c = config ();
    c.jwt_validity = seconds (601);
    assert (invalid_config (c));

    c = config ();
    c.retry.attempts = 0;
    assert (invalid_config (c));

    c = config ();
    c.retry.attempts = 11;
    assert (invalid_config (c));
  }

  return 0;
}
