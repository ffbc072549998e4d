#pragma once

/**
 * semnote
 *
 * Semantic search over a corpus of text notes: notes are chunked into
 * documents, embedded, stored in SQLite and queried by cosine similarity.
 */

#include <semnote/types.hpp>
#include <semnote/config.hpp>
#include <semnote/chunker.hpp>
#include <semnote/notes.hpp>
#include <semnote/embedding/embedder.hpp>
#include <semnote/embedding/embedding_client.hpp>
#include <semnote/store/document_store.hpp>
#include <semnote/index_manager.hpp>
#include <semnote/query_engine.hpp>
