#pragma once

/// @file otpm.hpp
/// @brief Umbrella header for the otpm library.

#include "otpm/version.hpp"

#include "otpm/core/result.hpp"
#include "otpm/foundation/config_manager.hpp"
#include "otpm/foundation/error_code.hpp"
#include "otpm/foundation/otp_error.hpp"
#include "otpm/foundation/otp_logger.hpp"
#include "otpm/foundation/otp_result.hpp"

#include "otpm/token/in_memory_directory.hpp"
#include "otpm/token/key_codec.hpp"
#include "otpm/token/manager_config.hpp"
#include "otpm/token/owner_resolver.hpp"
#include "otpm/token/provisioning_uri.hpp"
#include "otpm/token/schema_resolver.hpp"
#include "otpm/token/search_filter.hpp"
#include "otpm/token/token_manager.hpp"
#include "otpm/token/token_store.hpp"
#include "otpm/token/token_sync.hpp"
#include "otpm/token/token_types.hpp"
#include "otpm/token/validity_validator.hpp"
