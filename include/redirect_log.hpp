#ifndef REDIRECT_LOG_HPP
#define REDIRECT_LOG_HPP

#include "redirect_log/core/log_common.hpp"
#include "redirect_log/core/log_level.hpp"
#include "redirect_log/core/event_id.hpp"
#include "redirect_log/core/exception_info.hpp"
#include "redirect_log/core/log_record.hpp"
#include "redirect_log/core/message_template.hpp"
#include "redirect_log/scope/log_scope.hpp"
#include "redirect_log/scope/scope_provider.hpp"
#include "redirect_log/scope/external_scope_provider.hpp"
#include "redirect_log/formatter/test_output_formatter.hpp"
#include "redirect_log/output/test_output.hpp"
#include "redirect_log/output/stream_output.hpp"
#include "redirect_log/output/callback_output.hpp"
#include "redirect_log/config/configuration.hpp"
#include "redirect_log/config/json_configuration.hpp"
#include "redirect_log/config/environment_configuration.hpp"
#include "redirect_log/config/formatter_options.hpp"
#include "redirect_log/config/logging_services.hpp"
#include "redirect_log/config/scope_discovery.hpp"
#include "redirect_log/provider/logger.hpp"
#include "redirect_log/provider/test_logger.hpp"
#include "redirect_log/provider/test_logger_provider.hpp"
#include "redirect_log/provider/logging_builder.hpp"

#endif // REDIRECT_LOG_HPP
