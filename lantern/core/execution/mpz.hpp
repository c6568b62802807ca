// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmp.h>

#include <lantern/core/common/bytes.hpp>

namespace lantern::precompile {

//! Owning wrapper of a GMP integer
class Mpz {
  public:
    Mpz() { mpz_init(value_); }
    explicit Mpz(ByteView big_endian) : Mpz() {
        if (!big_endian.empty()) {
            mpz_import(value_, big_endian.size(), /*order=*/1, /*size=*/1, /*endian=*/0, /*nails=*/0, big_endian.data());
        }
    }
    ~Mpz() { mpz_clear(value_); }

    Mpz(const Mpz&) = delete;
    Mpz& operator=(const Mpz&) = delete;

    mpz_ptr get() { return value_; }
    mpz_srcptr get() const { return value_; }

    bool is_zero() const { return mpz_sgn(value_) == 0; }

    //! Big-endian encoding left-padded to size bytes; the value must fit
    Bytes to_big_endian(size_t size) const {
        Bytes out(size, 0);
        if (is_zero()) {
            return out;
        }
        const size_t len{(mpz_sizeinbase(value_, 2) + 7) / 8};
        mpz_export(&out[size - len], nullptr, /*order=*/1, /*size=*/1, /*endian=*/0, /*nails=*/0, value_);
        return out;
    }

  private:
    mpz_t value_;
};

}  // namespace lantern::precompile
