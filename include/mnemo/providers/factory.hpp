#pragma once

#include "mnemo/config/schema.hpp"
#include "mnemo/providers/traits.hpp"

#include <memory>

namespace mnemo::providers {

[[nodiscard]] std::shared_ptr<ICompletionClient>
create_completion_client(const config::Config &config,
                         std::shared_ptr<HttpClient> http_client = nullptr);

} // namespace mnemo::providers
