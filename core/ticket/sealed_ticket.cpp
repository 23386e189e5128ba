/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ticket/sealed_ticket.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/optional.hpp>
#include <algorithm>
#include <memory>

#include "common/bytes.hpp"
#include "crypto/sha/sha256.hpp"
#include "ticket/ticket_error.hpp"

namespace vegam::ticket {
  namespace {
    constexpr size_t kNonceSize{12};
    constexpr size_t kTagSize{16};
    constexpr std::string_view kKeyDomain{"vegam-ticket-key-"};

    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX,
                                      decltype(&EVP_CIPHER_CTX_free)>;

    crypto::sha::Hash256 deriveKey(std::string_view node_id) {
      std::string material{kKeyDomain};
      material.append(node_id);
      return crypto::sha::sha256(common::span::cbytes(material));
    }

    std::string base64url(BytesIn input) {
      std::string out;
      out.resize(4 * ((input.size() + 2) / 3) + 1);
      auto n = EVP_EncodeBlock(
          reinterpret_cast<uint8_t *>(out.data()),  // NOLINT
          input.data(),
          static_cast<int>(input.size()));
      out.resize(n);
      while (!out.empty() && out.back() == '=') {
        out.pop_back();
      }
      std::replace(out.begin(), out.end(), '+', '-');
      std::replace(out.begin(), out.end(), '/', '_');
      return out;
    }

    boost::optional<Bytes> unbase64url(std::string_view input) {
      std::string str{input};
      if (str.size() % 4 == 1) {
        return boost::none;
      }
      if (std::any_of(str.begin(), str.end(), [](char c) {
            return c == '+' || c == '/' || c == '=';
          })) {
        return boost::none;
      }
      std::replace(str.begin(), str.end(), '-', '+');
      std::replace(str.begin(), str.end(), '_', '/');
      const size_t padding{(4 - str.size() % 4) % 4};
      str.append(padding, '=');
      Bytes out;
      out.resize(str.size() / 4 * 3);
      auto n = EVP_DecodeBlock(
          out.data(),
          reinterpret_cast<const uint8_t *>(str.data()),  // NOLINT
          static_cast<int>(str.size()));
      if (n < 0 || static_cast<size_t>(n) < padding) {
        return boost::none;
      }
      out.resize(n - padding);
      return out;
    }
  }  // namespace

  bool isSealedTicket(std::string_view ticket) {
    return ticket.substr(0, kSealedPrefix.size()) == kSealedPrefix;
  }

  outcome::result<std::string> sealTicket(std::string_view ticket,
                                          const std::string &node_id) {
    if (node_id.empty() || node_id.find(':') != std::string::npos) {
      return TicketError::kSealedTicketMalformed;
    }
    const auto key{deriveKey(node_id)};
    Bytes payload(kNonceSize + ticket.size() + kTagSize);
    if (RAND_bytes(payload.data(), kNonceSize) != 1) {
      return TicketError::kSealedTicketMalformed;
    }

    CipherCtx ctx{EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    int len{};
    auto plain{common::span::cbytes(ticket)};
    auto cipher{payload.data() + kNonceSize};
    if (!ctx
        || EVP_EncryptInit_ex(
               ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
               != 1
        || EVP_CIPHER_CTX_ctrl(
               ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceSize, nullptr)
               != 1
        || EVP_EncryptInit_ex(
               ctx.get(), nullptr, nullptr, key.data(), payload.data())
               != 1
        || EVP_EncryptUpdate(ctx.get(),
                             cipher,
                             &len,
                             plain.data(),
                             static_cast<int>(plain.size()))
               != 1
        || EVP_EncryptFinal_ex(ctx.get(), cipher + len, &len) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(),
                               EVP_CTRL_GCM_GET_TAG,
                               kTagSize,
                               cipher + ticket.size())
               != 1) {
      return TicketError::kSealedTicketMalformed;
    }

    std::string sealed{kSealedPrefix};
    sealed.append(node_id).append(1, ':').append(base64url(payload));
    return sealed;
  }

  outcome::result<std::string> unsealTicket(std::string_view sealed) {
    if (!isSealedTicket(sealed)) {
      return TicketError::kSealedTicketMalformed;
    }
    auto body{sealed.substr(kSealedPrefix.size())};
    auto colon{body.find(':')};
    if (colon == std::string_view::npos || colon == 0) {
      return TicketError::kSealedTicketMalformed;
    }
    auto node_id{body.substr(0, colon)};
    auto payload{unbase64url(body.substr(colon + 1))};
    if (!payload || payload->size() < kNonceSize + kTagSize) {
      return TicketError::kSealedTicketMalformed;
    }

    const auto key{deriveKey(node_id)};
    const auto cipher_size{payload->size() - kNonceSize - kTagSize};
    auto cipher{payload->data() + kNonceSize};
    auto tag{cipher + cipher_size};
    std::string plain(cipher_size, '\0');
    auto plain_ptr{reinterpret_cast<uint8_t *>(plain.data())};  // NOLINT

    CipherCtx ctx{EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    int len{};
    if (!ctx
        || EVP_DecryptInit_ex(
               ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
               != 1
        || EVP_CIPHER_CTX_ctrl(
               ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceSize, nullptr)
               != 1
        || EVP_DecryptInit_ex(
               ctx.get(), nullptr, nullptr, key.data(), payload->data())
               != 1
        || EVP_DecryptUpdate(ctx.get(),
                             plain_ptr,
                             &len,
                             cipher,
                             static_cast<int>(cipher_size))
               != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagSize, tag)
               != 1
        || EVP_DecryptFinal_ex(ctx.get(), plain_ptr + len, &len) != 1) {
      return TicketError::kSealedTicketUndecryptable;
    }
    return plain;
  }

  outcome::result<std::string> unsealIfSealed(std::string_view ticket) {
    if (isSealedTicket(ticket)) {
      return unsealTicket(ticket);
    }
    return std::string{ticket};
  }
}  // namespace vegam::ticket
