#pragma once

#include "query/db_manager.hpp"
#include "query/query_result.hpp"
#include <cstdint>
#include <string>

namespace sqlbridge::drupal {

/**
 * @brief Read-only lookups over a Drupal 8+ content schema
 *
 * Every query names tables as {logical} placeholders, so the configured
 * prefix applies. Single-entity lookups fetch one row.
 */
class ContentRepository {
public:
    explicit ContentRepository(query::DbManager& db);

    // node_field_data with author name and body (current or revision)
    query::QueryResult get_node_by_id(std::int64_t nid);

    query::QueryResult list_content_types();

    query::QueryResult get_taxonomy_term_by_id(std::int64_t tid);

    query::QueryResult list_vocabularies();

    // users_field_data with a comma-separated "roles" column
    query::QueryResult get_user_by_id(std::int64_t uid);

    // Paragraphs referenced through node__<field>, in delta order.
    // field must be a plain identifier; otherwise nothing runs and an
    // UNSAFE_IDENTIFIER error is returned.
    query::QueryResult list_paragraphs_by_node_id(std::int64_t nid, const std::string& field);

private:
    query::DbManager& db_;
};

} // namespace sqlbridge::drupal
