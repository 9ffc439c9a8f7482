/* Ordo
 * Copyright 2026 The Ordo Authors
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "ordo/common.hpp"

namespace ordo
{

// Static initializers.

const boost::unordered_multimap<Ordo_log_component, std::string> S_ORDO_LOG_COMPONENT_NAME_MAP
  {
    { Ordo_log_component::S_UNCAT, "UNCAT" },
    { Ordo_log_component::S_LOG, "LOG" },
    { Ordo_log_component::S_MAP, "MAP" },
    { Ordo_log_component::S_VIEW, "VIEW" },
    { Ordo_log_component::S_CONTAINER, "CONTAINER" }
  };

} // namespace ordo
