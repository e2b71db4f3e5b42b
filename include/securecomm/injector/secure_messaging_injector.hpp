/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/di.hpp>

// implementations
#include <securecomm/crypto/aead_cipher/aead_cipher_impl.hpp>
#include <securecomm/crypto/hardware_key_provider/software_key_provider.hpp>
#include <securecomm/crypto/hmac_provider/hmac_provider_impl.hpp>
#include <securecomm/crypto/key_agreement/key_agreement_impl.hpp>
#include <securecomm/crypto/key_marshaller/key_marshaller_impl.hpp>
#include <securecomm/crypto/message_authenticator/message_authenticator_impl.hpp>
#include <securecomm/crypto/random_generator/boost_generator.hpp>
#include <securecomm/crypto/secure_messenger/secure_messenger_impl.hpp>
#include <securecomm/storage/in_memory_key_storage.hpp>

// clang-format off
/**
 * @file secure_messaging_injector.hpp
 * @brief This header defines DI injector helpers, which can be used instead of
 * manual wiring.
 *
 * By default:
 * - private key is kept by SoftwareKeyProvider
 * - key handle is stored in InMemoryKeyStorage
 * - AES-256-GCM is used for sealing
 *
 * <b>Example</b>: Keep the key in SQLite database, seal with ChaCha20-Poly1305
 * @code
 * auto storage = std::make_shared<storage::SqliteKeyStorage>(
 *     storage::SqliteKeyStorage::Config{"keys.sqlite"});
 * auto injector = makeSecureMessagingInjector(
 *     useKeyStorage(storage),
 *     useConfig(crypto::AeadAlgorithm::CHACHA20_POLY1305));
 * auto messenger = injector.create<std::shared_ptr<crypto::SecureMessenger>>();
 * @endcode
 */
// clang-format on

namespace securecomm::injector {

  /**
   * @brief Instruct injector to use specific config type. Can be used many
   * times for different types.
   * @tparam C config type
   * @param c config instance
   * @return injector binding
   *
   * @code
   * auto injector = makeSecureMessagingInjector(
   *   useConfig(crypto::KeyAgreement::Config{"my.app.key"})
   * );
   * @endcode
   */
  template <typename C>
  inline auto useConfig(C &&c) {
    return boost::di::bind<std::decay_t<C>>().template to(
        std::forward<C>(c))[boost::di::override];
  }

  /**
   * @brief Instruct injector to persist key handles in the given storage
   */
  inline auto useKeyStorage(std::shared_ptr<storage::KeyStorage> key_storage) {
    return boost::di::bind<storage::KeyStorage>().template to(
        std::move(key_storage))[boost::di::override];
  }

  /**
   * @brief Instruct injector to use the given root of trust
   */
  inline auto useHardwareKeyProvider(
      std::shared_ptr<crypto::HardwareKeyProvider> provider) {
    return boost::di::bind<crypto::HardwareKeyProvider>().template to(
        std::move(provider))[boost::di::override];
  }

  template <typename InjectorConfig = BOOST_DI_CFG, typename... Ts>
  inline auto makeSecureMessagingInjector(Ts &&...args) {
    namespace di = boost::di;

    // clang-format off
    return di::make_injector<InjectorConfig>(
        di::bind<crypto::random::CSPRNG>().template to<crypto::random::BoostRandomGenerator>(),
        di::bind<crypto::hmac::HmacProvider>().template to<crypto::hmac::HmacProviderImpl>(),
        di::bind<crypto::marshaller::KeyMarshaller>().template to<crypto::marshaller::KeyMarshallerImpl>(),
        di::bind<crypto::HardwareKeyProvider>().template to<crypto::SoftwareKeyProvider>(),
        di::bind<storage::KeyStorage>().template to<storage::InMemoryKeyStorage>(),
        di::bind<crypto::KeyAgreement>().template to<crypto::KeyAgreementImpl>(),
        di::bind<crypto::AeadCipher>().template to<crypto::AeadCipherImpl>(),
        di::bind<crypto::MessageAuthenticator>().template to<crypto::MessageAuthenticatorImpl>(),
        di::bind<crypto::SecureMessenger>().template to<crypto::SecureMessengerImpl>(),

        di::bind<crypto::SoftwareKeyProvider::Config>.template to(crypto::SoftwareKeyProvider::Config{}),
        di::bind<crypto::KeyAgreement::Config>.template to(crypto::KeyAgreement::Config{crypto::KeyAgreement::kDefaultKeyTag}),
        di::bind<crypto::AeadAlgorithm>.template to(crypto::AeadAlgorithm::AES_GCM),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...
    );
    // clang-format on
  }

}  // namespace securecomm::injector
