#ifndef FOLIO_STOCK_MANAGER_PROXY_H
#define FOLIO_STOCK_MANAGER_PROXY_H

#include <cstdint>
#include <vector>

#include "../common/bookstore.hh"
#include "../common/config.hh"
#include "rpc_channel.hh"

// Administrative operations forwarded to a remote Folio server.
class StockManagerProxy : public StockManager {
public:
    explicit StockManagerProxy(const ClientConfig& conf);
    ~StockManagerProxy() override = default;

    void add_books(const std::vector<StockBook>* books) override;
    void add_copies(const std::vector<BookCopy>* copies) override;
    std::vector<StockBook> get_books() override;
    std::vector<StockBook> get_books_by_isbn(const std::vector<int32_t>* isbns) override;
    void update_editor_picks(const std::vector<BookEditorPick>* picks) override;
    std::vector<StockBook> get_books_in_demand() override;
    void remove_books(const std::vector<int32_t>* isbns) override;
    void remove_all_books() override;

    RpcChannel& channel() { return channel_; }

private:
    RpcChannel channel_;
};

#endif // FOLIO_STOCK_MANAGER_PROXY_H
