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

#include "base.hpp"

namespace addrcodec {

const buildinfo* get_buildinfo() noexcept { return addrcodec_get_buildinfo(); }

std::string get_buildinfo_string() noexcept {
    std::string ret{};
    const auto* build_info = get_buildinfo();
    ret.append(build_info->project_name);
    ret.append(" ");
    ret.append(build_info->project_version);
    ret.append(" ");
    ret.append(build_info->system_name);
    ret.append("-");
    ret.append(build_info->system_processor);
    ret.append("_");
    ret.append(build_info->build_type);
    ret.append("/");
    ret.append(build_info->compiler_id);
    ret.append("-");
    ret.append(build_info->compiler_version);
    return ret;
}
}  // namespace addrcodec
