// file      : libcredtool/orchestrator.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_ORCHESTRATOR_HXX
#define LIBCREDTOOL_ORCHESTRATOR_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>
#include <libcredtool/retry.hxx>
#include <libcredtool/signer.hxx>
#include <libcredtool/failure.hxx>
#include <libcredtool/delivery.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/diagnostics.hxx>
#include <libcredtool/token-exchanger.hxx>
#include <libcredtool/runner-token-requester.hxx>

namespace credtool
{
  // The pipeline states, in the order of transitions. The failed state is
  // reachable from any non-terminal state.
  //
  enum class pipeline_state: uint8_t
  {
    idle,
    signing,
    exchanging,
    requesting_token,
    delivering,
    done,
    failed
  };

  string
  to_string (pipeline_state);

  inline ostream&
  operator<< (ostream& os, pipeline_state s)
  {
    return os << to_string (s);
  }

  // Pipeline configuration. Constructed once and passed to the orchestrator
  // which hands the relevant parts to the stages.
  //
  struct orchestrator_config
  {
    identity app;
    installation_scope installation;
    runner_spec runner;
    destination output;

    std::chrono::seconds jwt_validity {600};
    retry_policy retry;
  };

  // Sequence the stages: sign the identity assertion, exchange it for the
  // installation access credential, request the runner registration token,
  // and deliver it.
  //
  // Retry the rate limit and transport failures within the stage according
  // to the retry policy. Clamp the credential expiration times so that no
  // credential outlives the one it is produced from.
  //
  class orchestrator
  {
  public:
    // The configuration is copied. Throw invalid_argument if it is invalid.
    //
    orchestrator (const orchestrator_config&,
                  signer&,
                  token_exchanger&,
                  runner_token_requester&,
                  pipeline_clock&,
                  const cancellation&,
                  ostream& out,
                  const diag_epilogue& log_writer,
                  uint16_t verbosity = 0);

    // Run the pipeline and return the process exit status: 0 if the token
    // is delivered and the failure kind's exit code otherwise. The terminal
    // failure is logged as an error.
    //
    // Should only be called once.
    //
    int
    run ();

    pipeline_state
    state () const {return state_;}

    // The failure the pipeline terminated with, if any.
    //
    const optional<failure_kind>&
    reason () const {return reason_;}

    const optional<failure>&
    error () const {return error_;}

    // If specified, called with the previous and the new state on every
    // transition.
    //
    function<void (pipeline_state, pipeline_state)> on_transition;

  private:
    void
    transition (pipeline_state);

    // Call the stage function retrying according to the policy and logging
    // the retries as warnings.
    //
    template <typename F>
    auto
    attempt (F&&) -> decltype (declval<F> () ());

  private:
    const orchestrator_config config_;
    signer& signer_;
    token_exchanger& exchanger_;
    runner_token_requester& requester_;
    pipeline_clock& clock_;
    const cancellation& cancel_;
    ostream& out_;

    pipeline_state state_ = pipeline_state::idle;
    optional<failure_kind> reason_;
    optional<failure> error_;

    // Diagnostics.
    //
    // 0 - tracing disabled.
    // 1 - stage transitions and credential expiration adjustments.
    // 2 - redacted stage results.
    //
    uint16_t verb_;

    template <class F> void l1 (const F& f) const {if (verb_ >= 1) f ();}
    template <class F> void l2 (const F& f) const {if (verb_ >= 2) f ();}

    const diag_epilogue log_writer_;

    const basic_mark error_mark_;
    const basic_mark warn_;
    const basic_mark info_;
    const basic_mark trace_;
  };
}

#endif // LIBCREDTOOL_ORCHESTRATOR_HXX
