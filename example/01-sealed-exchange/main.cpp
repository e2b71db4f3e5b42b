/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <span>
#include <string>

#include <fmt/format.h>

#include <securecomm/common/hexutil.hpp>
#include <securecomm/common/literals.hpp>
#include <securecomm/injector/secure_messaging_injector.hpp>
#include <securecomm/log/configurator.hpp>
#include <securecomm/log/logger.hpp>
#include <securecomm/storage/sqlite_key_storage.hpp>

namespace {
  const std::string logger_config(R"(
# ----------------
sinks:
 - name: console
   type: console
   color: true
groups:
 - name: main
   sink: console
   level: info
   children:
     - name: securecomm
# ----------------
 )");

  /// one party of the exchange, owns its key and its storage
  struct Party {
    std::shared_ptr<securecomm::crypto::KeyAgreement> key_agreement;
    std::shared_ptr<securecomm::crypto::SecureMessenger> messenger;
  };

  template <typename... Ts>
  Party makeParty(Ts &&...args) {
    auto injector = securecomm::injector::makeSecureMessagingInjector(
        std::forward<Ts>(args)...);
    return Party{
        injector.template create<
            std::shared_ptr<securecomm::crypto::KeyAgreement>>(),
        injector.template create<
            std::shared_ptr<securecomm::crypto::SecureMessenger>>()};
  }
}  // namespace

int main(int argc, char **argv) {
  using securecomm::crypto::AeadAlgorithm;
  using securecomm::crypto::PublicKeyEncoding;
  using securecomm::common::operator""_v;
  namespace injector = securecomm::injector;

  auto args = std::span(argv, argc).subspan(1);
  auto has_arg = [&](std::string_view arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
  };

  if (has_arg("-h") or has_arg("--help")) {
    fmt::print("Usage: sealed_exchange [--chacha] [--db <file>]\n");
    fmt::print("  --chacha\n");
    fmt::print("    Seal with ChaCha20-Poly1305 instead of AES-256-GCM\n");
    fmt::print("  --db <file>\n");
    fmt::print("    Keep Alice's key handle in a SQLite database\n");
    return 0;
  }

  // prepare log system
  auto logging_system = std::make_shared<soralog::LoggingSystem>(
      std::make_shared<soralog::ConfiguratorFromYAML>(
          std::make_shared<securecomm::log::Configurator>(), logger_config));
  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << std::endl;
  }
  if (r.has_error) {
    exit(EXIT_FAILURE);
  }
  securecomm::log::setLoggingSystem(logging_system);
  if (std::getenv("TRACE_DEBUG") != nullptr) {
    securecomm::log::setLevelOfGroup("main", soralog::Level::TRACE);
  } else {
    securecomm::log::setLevelOfGroup("main", soralog::Level::INFO);
  }
  auto log = securecomm::log::createLogger("SealedExchange", "main");

  auto algorithm = has_arg("--chacha") ? AeadAlgorithm::CHACHA20_POLY1305
                                       : AeadAlgorithm::AES_GCM;

  std::shared_ptr<securecomm::storage::KeyStorage> alice_storage =
      std::make_shared<securecomm::storage::InMemoryKeyStorage>();
  if (auto it = std::find(args.begin(), args.end(), std::string_view{"--db"});
      it != args.end() and std::next(it) != args.end()) {
    alice_storage = std::make_shared<securecomm::storage::SqliteKeyStorage>(
        securecomm::storage::SqliteKeyStorage::Config{*std::next(it)});
  }

  auto alice = makeParty(injector::useKeyStorage(alice_storage),
                         injector::useConfig(AeadAlgorithm{algorithm}));
  auto bob = makeParty(
      injector::useKeyStorage(
          std::make_shared<securecomm::storage::InMemoryKeyStorage>()),
      injector::useConfig(
          securecomm::crypto::KeyAgreement::Config{"example.bob.key"}),
      injector::useConfig(AeadAlgorithm{algorithm}));

  auto fail = [&](std::string_view what, const std::error_code &ec) {
    log->error("{}: {}", what, ec);
    return EXIT_FAILURE;
  };

  // public keys travel as PEM text
  auto alice_pem = alice.key_agreement->localPublicKey(PublicKeyEncoding::PEM);
  if (not alice_pem) {
    return fail("Alice has no public key", alice_pem.error());
  }
  auto bob_pem = bob.key_agreement->localPublicKey(PublicKeyEncoding::PEM);
  if (not bob_pem) {
    return fail("Bob has no public key", bob_pem.error());
  }
  fmt::print("Alice's public key:\n{}",
             std::string(alice_pem.value().begin(), alice_pem.value().end()));

  auto bob_key = alice.key_agreement->parsePublicKey(bob_pem.value(),
                                                     PublicKeyEncoding::PEM);
  auto alice_key = bob.key_agreement->parsePublicKey(alice_pem.value(),
                                                     PublicKeyEncoding::PEM);
  if (not bob_key or not alice_key) {
    log->error("Public key exchange failed");
    return EXIT_FAILURE;
  }

  // every call below derives the key for the peer from scratch
  auto salt = "sealed-exchange-example"_v;
  auto message = "Meet me at the usual place"_v;
  auto sealed = alice.messenger->seal(message, bob_key.value(), salt);
  if (not sealed) {
    return fail("Sealing failed", sealed.error());
  }
  fmt::print("Sealed message: {}\n",
             securecomm::common::hex_lower(sealed.value()));

  auto opened = bob.messenger->open(sealed.value(), alice_key.value(), salt);
  if (not opened) {
    return fail("Opening failed", opened.error());
  }
  fmt::print("Bob reads: {}\n",
             std::string(opened.value().begin(), opened.value().end()));

  auto code = alice.messenger->computeCode(message, bob_key.value(), salt);
  if (not code) {
    return fail("MAC computation failed", code.error());
  }
  auto authentic = bob.messenger->verifyCode(
      code.value(), message, alice_key.value(), salt);
  if (not authentic) {
    return fail("MAC verification failed", authentic.error());
  }
  fmt::print("Bob verifies the code: {}\n",
             authentic.value() ? "valid" : "invalid");

  return authentic.value() ? EXIT_SUCCESS : EXIT_FAILURE;
}
