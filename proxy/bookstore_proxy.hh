#ifndef FOLIO_BOOKSTORE_PROXY_H
#define FOLIO_BOOKSTORE_PROXY_H

#include <cstdint>
#include <vector>

#include "../common/bookstore.hh"
#include "../common/config.hh"
#include "rpc_channel.hh"

// Customer-facing operations forwarded to a remote Folio server.
class BookStoreProxy : public BookStore {
public:
    explicit BookStoreProxy(const ClientConfig& conf);
    ~BookStoreProxy() override = default;

    void buy_books(const std::vector<BookCopy>* copies) override;
    std::vector<Book> get_books(const std::vector<int32_t>* isbns) override;
    std::vector<Book> get_editor_picks(int32_t num_books) override;
    void rate_books(const std::vector<BookRating>* ratings) override;
    std::vector<Book> get_top_rated_books(int32_t num_books) override;

    RpcChannel& channel() { return channel_; }

private:
    RpcChannel channel_;
};

#endif // FOLIO_BOOKSTORE_PROXY_H
