#pragma once

#include "Document.h"
#include <string>
#include <utility>

namespace roommaker {

// Scoped transaction on a Document.
// Rolls back on destruction unless commit() succeeded, so every exit path
// (early return, exception) releases the document.
//
// Usage:
//   Transaction tx(doc, "Create Room");
//   if (!tx.start()) return false;
//   ... create elements ...
//   if (!tx.commit()) return false;
class Transaction {
public:
    Transaction(Document& document, std::string name)
        : document_(&document), name_(std::move(name)) {}

    ~Transaction() {
        if (started_ && !finished_) {
            document_->rollbackTransaction();
        }
    }

    // Move-only
    Transaction(Transaction&& other) noexcept
        : document_(other.document_)
        , name_(std::move(other.name_))
        , started_(other.started_)
        , finished_(other.finished_) {
        other.finished_ = true;
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    bool start() {
        if (started_) {
            return false;
        }
        started_ = document_->beginTransaction(name_);
        return started_;
    }

    // On failure the document has already rolled the changes back
    bool commit() {
        if (!started_ || finished_) {
            return false;
        }
        finished_ = true;
        return document_->commitTransaction();
    }

    void rollback() {
        if (started_ && !finished_) {
            finished_ = true;
            document_->rollbackTransaction();
        }
    }

    bool isActive() const { return started_ && !finished_; }
    const std::string& name() const { return name_; }

private:
    Document* document_;
    std::string name_;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace roommaker
