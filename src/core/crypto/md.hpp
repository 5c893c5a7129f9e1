/*
   Copyright 2026 The Addrcodec Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

#include <core/common/base.hpp>

namespace addrcodec::crypto {

//! \brief Explicit deleter for EVP_MD_CTXes
struct MDContextDeleter {
    constexpr MDContextDeleter() noexcept = default;
    void operator()(EVP_MD_CTX* ptr) const noexcept { EVP_MD_CTX_free(ptr); }
};

//! \brief This class is templatized wrapper around OpenSSL's EVP Message Digests
//! \remarks Every instance owns its own context hence distinct instances can be used concurrently
template <StringLiteral T>
class MessageDigest {
  public:
    //! \throws std::runtime_error when the linked OpenSSL does not provide the digest
    MessageDigest() : digest_{EVP_get_digestbyname(T.value)}, digest_context_{EVP_MD_CTX_new()} {
        if (digest_ == nullptr) throw std::runtime_error("Digest " + digest_name() + " is not available");
        if (not digest_context_ or EVP_DigestInit_ex(digest_context_.get(), digest_, nullptr) not_eq 1) {
            throw std::runtime_error("Unable to initialize digest " + digest_name());
        }
        digest_size_ = static_cast<size_t>(EVP_MD_size(digest_));
        block_size_ = static_cast<size_t>(EVP_MD_block_size(digest_));
    }

    MessageDigest(MessageDigest& other) = delete;
    MessageDigest(MessageDigest&& other) = delete;
    MessageDigest& operator=(const MessageDigest& other) = delete;
    ~MessageDigest() = default;

    //! \brief Instantiation with data initialization
    explicit MessageDigest(ByteView data) : MessageDigest() { update(data); }

    //! \brief Re-initialize the context pristine
    void inline init() noexcept {
        ingested_size_ = 0;
        EVP_DigestInit_ex(digest_context_.get(), digest_, nullptr);
    }

    //! \brief Re-initialize the context to provided initial data
    void init(ByteView data) noexcept {
        init();
        update(data);
    }

    //! \brief Accumulates more data into the digest
    void update(ByteView data) noexcept {
        if (data.empty()) return;
        ingested_size_ += data.size();
        EVP_DigestUpdate(digest_context_.get(), data.data(), data.size());
    }

    //! \brief Finalizes the digest process and produces the actual digest
    //! \remarks After this instance has called finalize() once the instance itself cannot accept new updates
    //! unless it's recycled by init(). In case of any error the returned digest will be zero length
    [[nodiscard]] Bytes finalize() noexcept {
        Bytes ret(digest_size_, 0);
        if (EVP_DigestFinal_ex(digest_context_.get(), ret.data(), nullptr) == 0 /* zero is failure not success */) {
            ret.clear();
        }
        return ret;
    }

    //! \brief Returns the digest name e.g. "SHA256"
    [[nodiscard]] std::string digest_name() const noexcept { return std::string(T.value); }

    //! \brief Returns the size (in bytes) of the final digest
    [[nodiscard]] size_t digest_size() const noexcept { return digest_size_; }

    //! \brief Returns the size (in bytes) of an input block
    [[nodiscard]] size_t block_size() const noexcept { return block_size_; }

    //! \brief Returns the number of bytes already digested
    [[nodiscard]] size_t ingested_size() const noexcept { return ingested_size_; }

  private:
    const EVP_MD* digest_{nullptr};                                          // The digest function
    std::unique_ptr<EVP_MD_CTX, MDContextDeleter> digest_context_{nullptr};  // The digest context
    size_t digest_size_{0};                                                  // The size in bytes of this digest
    size_t block_size_{0};                                                   // The size in bytes of an input block
    size_t ingested_size_{0};                                                // Number of bytes ingested
};

using Ripemd160 = MessageDigest<"RIPEMD160">;
using Sha256 = MessageDigest<"SHA256">;

}  // namespace addrcodec::crypto
