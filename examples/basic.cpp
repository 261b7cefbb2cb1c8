////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <lhl/LHList.hpp>
#include <lhl/Version.hpp>
#include <lhl/utils/Logger.hpp>
#include <lhl/utils/environment_vars.hpp>
#include <lhl/utils/strings.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

LHL_NEW_NAMED_LABEL(MyLabel, "My Label!", std::uint16_t);
LHL_NEW_LABEL(Count, int);
LHL_NEW_LABEL(Name, std::string);
LHL_NEW_LABEL(Active, bool);

// Run with LHL_LOG_LEVEL=debug to see the lists in the log, or with
// --settings to list what can be configured.
int main(int argc, char* argv[])
{
  if (argc > 1 && std::string(argv[1]) == "--settings")
  {
    for (auto const& name : lhl::env::registered())
    {
      std::cout << "LHL_" << name << " (default "
                << lhl::env::get_default(name) << "): " << lhl::env::about(name)
                << std::endl;
    }
    return 0;
  }

  std::cout << lhl::label_name<MyLabel>() << std::endl;
  std::cout << std::numeric_limits<lhl::LabelType<MyLabel>>::max()
            << std::endl;

  auto record = lhl::lhlist(Count{} = 3, Name{} = "abc", Active{} = true);
  lhl::log_list(record, "record");

  record[Count{}] = 7;
  std::cout << record << std::endl;
  std::cout << lhl::describe_type<decltype(record)>() << std::endl;

  auto lengths = lhl::iter_values(record)
                   .map([](auto const& v) { return lhl::build_string(v).size(); })
                   .collect();
  lhl::log_list(lengths, "printed lengths");

  LHL_INFO("LHList v{} done", lhl::Version());
  return 0;
}
