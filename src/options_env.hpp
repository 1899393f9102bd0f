/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

namespace segalloc {

enum class parse_result { absent, ok, invalid };

// Parses value of an option variable. Accepts y/yes/t/true (1), n/no/f/false
// (0) and decimal numbers not greater than max.
parse_result parse_option(char const *s, unsigned long long max,
        unsigned long long &value) noexcept;

// Reads SEGALLOC_* variables of the environment into options. Invalid values
// are logged and ignored.
void read_options_from_env() noexcept;

} // namespace segalloc
