// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <utility>

namespace ccv {

class invalid_input : public std::exception {
public:
    explicit invalid_input(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

// Leading digit without an entry in the major industry table
class unknown_major_industry : public invalid_input {
public:
    explicit unknown_major_industry(char digit)
        : invalid_input(std::string("unknown major industry identifier: '") + digit + "'"),
          digit_(digit)
    {}

    [[nodiscard]] char digit() const noexcept { return digit_; }

protected:
    char digit_;
};

class entropy_exhausted : public std::exception {
public:
    [[nodiscard]] const char *what() const noexcept override
    {
        return "entropy source exhausted";
    }
};

} // namespace ccv
