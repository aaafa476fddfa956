#pragma once

#include "config/config.pb.h"

#include "internal/config/config_loader.hpp"
#include "internal/core/executor.hpp"
#include "internal/core/sql_props.hpp"
#include "internal/db/duckdb/connection_string.hpp"
#include "internal/db/sql/parameter_binder.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/db/sql/sql_value.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ducksql::v1 {
namespace sql = ::ducksql::sql;
namespace model = ::ducksql::model;
using namespace ::ducksql::util;
using ::ducksql::config::ConfigLoader;
using ::ducksql::db::duck::ConnectionStringBuilder;
using ::ducksql::factory::CreateConnection;
using ::ducksql::runtime::config::RuntimeConfig;
}
