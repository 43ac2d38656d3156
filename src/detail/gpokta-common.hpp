/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2024, The gp-okta Authors.
 *
 * This file is part of gp-okta, a GlobalProtect login helper for Okta SSO.
 *
 * gp-okta is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * gp-okta is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * gp-okta, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of gp-okta authors and contributors.
 */

#ifndef GPOKTA_DETAIL_GPOKTA_COMMON_HPP
#define GPOKTA_DETAIL_GPOKTA_COMMON_HPP

#include "detail/gpokta-config.hpp"

#ifdef GPOKTA_HAVE_TESTS
#define GPOKTA_VIRTUAL_WITH_TESTS virtual
#define GPOKTA_PUBLIC_WITH_TESTS_ELSE_PROTECTED public
#define GPOKTA_PUBLIC_WITH_TESTS_ELSE_PRIVATE public
#define GPOKTA_PROTECTED_WITH_TESTS_ELSE_PRIVATE protected
#else
#define GPOKTA_VIRTUAL_WITH_TESTS
#define GPOKTA_PUBLIC_WITH_TESTS_ELSE_PROTECTED protected
#define GPOKTA_PUBLIC_WITH_TESTS_ELSE_PRIVATE private
#define GPOKTA_PROTECTED_WITH_TESTS_ELSE_PRIVATE private
#endif

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <ndn-cxx/util/exception.hpp>
#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/time.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/assert.hpp>
#include <boost/noncopyable.hpp>
#include <boost/property_tree/ptree.hpp>

namespace gpokta {

using std::optional;
using std::nullopt;

namespace time = ndn::time;
using namespace ndn::time_literals;
using namespace std::string_literals;

using JsonSection = boost::property_tree::ptree;

/**
 * @brief Factor type tag to selection priority, higher is tried first.
 */
using FactorPriorities = std::map<std::string, int>;

// Okta authentication API vocabulary
namespace okta {

inline const std::string STATUS_SUCCESS = "SUCCESS";
inline const std::string STATUS_MFA_REQUIRED = "MFA_REQUIRED";
inline const std::string STATUS_MFA_CHALLENGE = "MFA_CHALLENGE";
inline const std::string STATUS_LOCKED_OUT = "LOCKED_OUT";
inline const std::string FACTOR_RESULT_WAITING = "WAITING";

inline const std::string FACTOR_PUSH = "push";
inline const std::string FACTOR_SMS = "sms";
inline const std::string FACTOR_WEBAUTHN = "webauthn";
inline const std::string FACTOR_TOKEN = "token";
inline const std::string FACTOR_SOFTWARE_TOTP = "token:software:totp";

} // namespace okta

} // namespace gpokta

#endif // GPOKTA_DETAIL_GPOKTA_COMMON_HPP
