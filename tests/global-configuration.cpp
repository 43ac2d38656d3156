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

#include "tests/test-common.hpp"

#include <system_error>

namespace gpokta::tests {

static const std::filesystem::path TESTDIR{UNIT_TESTS_TMPDIR};

/**
 * @brief Creates a fresh scratch directory for the test module and removes it afterwards.
 */
class GlobalConfiguration
{
public:
  GlobalConfiguration()
  {
    // left behind if an earlier run crashed
    std::filesystem::remove_all(TESTDIR);
    std::filesystem::create_directories(TESTDIR);
  }

  ~GlobalConfiguration() noexcept
  {
    std::error_code ec;
    std::filesystem::remove_all(TESTDIR, ec);
  }
};

BOOST_TEST_GLOBAL_CONFIGURATION(GlobalConfiguration);

std::filesystem::path
getTestDir()
{
  return TESTDIR;
}

} // namespace gpokta::tests
