// file      : libcredtool/signer.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_SIGNER_HXX
#define LIBCREDTOOL_SIGNER_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/diagnostics.hxx>

namespace credtool
{
  // Identity assertion signer.
  //
  class signer
  {
  public:
    virtual
    ~signer () = default;

    // Produce a fresh assertion (with a new nonce) for the identity, valid
    // for the specified period.
    //
    // Throw failure (key_unavailable, signing_failure, transport_failure on
    // timeout, cancelled).
    //
    virtual signed_assertion
    sign (const identity&, const std::chrono::seconds& ttl) = 0;
  };

  // The openssl program and its options.
  //
  struct openssl_options
  {
    path program {"openssl"};
    strings options;
  };

  // Sign with the private key using openssl:
  //
  //   openssl dgst -sha256 -sign <pkey>
  //
  class openssl_signer: public signer
  {
  public:
    // The backdate argument specifies the number of seconds to subtract from
    // the "issued at" time (see jwt_claims() for details). Throw
    // invalid_argument if the timeout is not positive.
    //
    openssl_signer (const openssl_options&,
                    pipeline_clock&,
                    const cancellation&,
                    duration timeout,
                    std::chrono::seconds backdate = std::chrono::seconds (60),
                    const basic_mark* trace = nullptr);

    virtual signed_assertion
    sign (const identity&, const std::chrono::seconds& ttl) override;

  private:
    const openssl_options& options_;
    pipeline_clock& clock_;
    const cancellation& cancel_;
    duration timeout_;
    std::chrono::seconds backdate_;
    const basic_mark* trace_;
  };

  // Maximum assertion validity period accepted by GitHub.
  //
  const std::chrono::seconds max_jwt_validity (600);

  // Generate a random nonce (UUID). Throw failure (signing_failure) if no
  // randomness source is available.
  //
  string
  generate_nonce ();
}

#endif // LIBCREDTOOL_SIGNER_HXX
