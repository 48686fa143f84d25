/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/adapter_factory.hpp>
#include <querygate/adapter/memory/memory_adapter.hpp>
#include <querygate/adapter/search/elasticsearch_adapter.hpp>
#include <querygate/adapter/sql/mysql_adapter.hpp>
#include <querygate/adapter/sql/postgres_adapter.hpp>
#include <querygate/adapter/sql/sqlite_adapter.hpp>

namespace querygate::adapter {

std::shared_ptr<Adapter> create_adapter(AdapterCapabilities capabilities, std::shared_ptr<BackendConnector> connector) {
    switch (capabilities.adapter_id()) {
    case AdapterId::POSTGRES:
        return std::make_shared<sql::PostgresAdapter>(std::move(capabilities), std::move(connector));
    case AdapterId::MYSQL:
        return std::make_shared<sql::MySqlAdapter>(std::move(capabilities), std::move(connector));
    case AdapterId::SQLITE:
        return std::make_shared<sql::SqliteAdapter>(std::move(capabilities), std::move(connector));
    case AdapterId::ELASTICSEARCH:
        return std::make_shared<search::ElasticsearchAdapter>(std::move(capabilities), std::move(connector));
    case AdapterId::MEMORY:
        return std::make_shared<memory::MemoryAdapter>(std::move(capabilities), std::move(connector));
    }
    adapter_selection::raise<ErrorCode::E_UNKNOWN_ADAPTER>("Unknown adapter id {}", static_cast<int>(capabilities.adapter_id()));
}

} // namespace querygate::adapter
