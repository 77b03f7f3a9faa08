/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <string_view>

/**
 * Contains support for logging.
 */
namespace logger {

/**
 * Initialise logging. Messages are appended to the given file, or go
 * to stderr if the filename is "-". Nothing is logged before this
 * has been called.
 */
void initialise(const std::string &filename);

/**
 * Log a message.
 */
void message(std::string_view m);

/**
 * Log a message under a category, e.g. "MIDDLEWARE" or "HANDLER".
 */
void message(std::string_view category, std::string_view m);
}

#endif /* LOGGER_HPP */
