#include "content_repository.hpp"
#include "core/db_error.hpp"
#include "core/logger.hpp"
#include "dialect/dialect.hpp"

namespace sqlbridge::drupal {

namespace {

const char* const NODE_BY_ID_QUERY = R"(
    SELECT
        nfd.nid, nfd.vid, nfd.type, nfd.langcode, nfd.status, nfd.uid,
        nfd.title, nfd.created, nfd.changed,
        ufd.name AS author_name,
        COALESCE(nb.body_value, nrb.body_value) AS body_value,
        COALESCE(nb.body_summary, nrb.body_summary) AS body_summary,
        COALESCE(nb.body_format, nrb.body_format) AS body_format
    FROM
        {node_field_data} nfd
    LEFT JOIN
        {users_field_data} ufd ON nfd.uid = ufd.uid
    LEFT JOIN
        {node__body} nb ON nfd.nid = nb.entity_id AND nfd.vid = nb.revision_id
                        AND nb.deleted = 0 AND nb.langcode = nfd.langcode
    LEFT JOIN
        {node_revision__body} nrb ON nfd.vid = nrb.revision_id
                                  AND nrb.deleted = 0 AND nrb.langcode = nfd.langcode
    WHERE
        nfd.nid = ?
)";

const char* const TERM_BY_ID_QUERY = R"(
    SELECT
        tfd.tid, tfd.vid, tfd.name, tfd.description, tfd.langcode,
        tv.name AS vocabulary_name
    FROM
        {taxonomy_term_field_data} tfd
    LEFT JOIN
        {taxonomy_vocabulary} tv ON tfd.vid = tv.vid
    WHERE
        tfd.tid = ?
)";

const char* const USER_FIELDS = "ufd.uid, ufd.name, ufd.mail, ufd.status, ufd.created, ufd.changed, ufd.langcode";

} // anonymous namespace

ContentRepository::ContentRepository(query::DbManager& db)
    : db_(db) {
}

query::QueryResult ContentRepository::get_node_by_id(std::int64_t nid) {
    return db_.execute(NODE_BY_ID_QUERY, {static_cast<long long>(nid)}, true);
}

query::QueryResult ContentRepository::list_content_types() {
    return db_.execute("SELECT type, name, description FROM {node_type}");
}

query::QueryResult ContentRepository::get_taxonomy_term_by_id(std::int64_t tid) {
    return db_.execute(TERM_BY_ID_QUERY, {static_cast<long long>(tid)}, true);
}

query::QueryResult ContentRepository::list_vocabularies() {
    return db_.execute("SELECT vid, name, description FROM {taxonomy_vocabulary}");
}

query::QueryResult ContentRepository::get_user_by_id(std::int64_t uid) {
    const std::string query =
        std::string("SELECT ") + USER_FIELDS + ", " +
        db_.dialect().string_aggregate("ur.roles_target_id") + " AS roles"
        " FROM {users_field_data} ufd"
        " LEFT JOIN {user__roles} ur ON ufd.uid = ur.entity_id"
        " WHERE ufd.uid = ?"
        " GROUP BY " + USER_FIELDS;

    return db_.execute(query, {static_cast<long long>(uid)}, true);
}

query::QueryResult ContentRepository::list_paragraphs_by_node_id(std::int64_t nid, const std::string& field) {
    if (!dialect::is_safe_identifier(field)) {
        std::string message = "Invalid paragraph field name: " + field;
        LOG_ERROR(message);
        return query::QueryResult::error(core::ErrorKind::UNSAFE_IDENTIFIER, message);
    }

    const std::string ref = "p_ref." + field;
    const std::string query =
        "SELECT"
        " " + ref + "_target_id AS paragraph_id,"
        " " + ref + "_target_revision_id AS paragraph_revision_id,"
        " pfd.id AS paragraph_item_id,"
        " pfd.type AS paragraph_type,"
        " pfd.langcode AS paragraph_langcode,"
        " pfd.status AS paragraph_status"
        " FROM {{{node__" + field + "}}} p_ref"
        " JOIN {paragraphs_item_field_data} pfd ON " + ref + "_target_id = pfd.id"
        " AND " + ref + "_target_revision_id = pfd.revision_id"
        " WHERE p_ref.entity_id = ? AND p_ref.deleted = 0"
        " ORDER BY p_ref.delta ASC";

    LOG_INFO("Listing paragraphs for node " + std::to_string(nid) + ", field " + field);

    query::QueryResult result = db_.execute(query, {static_cast<long long>(nid)});
    if (!result.ok()) {
        LOG_WARN("Paragraph query for node " + std::to_string(nid) + ", field " + field +
                 " failed: " + result.error_message());
    }
    return result;
}

} // namespace sqlbridge::drupal
