#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "../common/codec.hh"
#include "../server/rpc/bookstore_rpc.hh"
#include "test_util.hh"

class BookStoreRpcTest : public ::testing::Test {
protected:
    BookStoreRpcTest() : store_(std::make_shared<CatalogStore>(11)), rpc_(store_) {}

    void SetUp() override {
        auto books = TestBooks({1, 2}, 3);
        store_->add_books(&books);
    }

    RpcReply Dispatch(MessageType type, const google::protobuf::Message& request) {
        RpcReply reply;
        rpc_.handle_rpc(1, static_cast<uint32_t>(type), request.SerializeAsString(), reply);
        return reply;
    }

    static Folio::Protocol::Response Envelope(const RpcReply& reply) {
        EXPECT_EQ(reply.status, status::kOk);
        EXPECT_EQ(reply.content_type, ContentType::ENVELOPE);
        Folio::Protocol::Response response;
        EXPECT_TRUE(response.ParseFromString(reply.payload));
        return response;
    }

    std::shared_ptr<CatalogStore> store_;
    BookStoreRpc rpc_;
};

TEST_F(BookStoreRpcTest, BuyBooksReachesTheStore) {
    Folio::Protocol::BuyBooks::Request request;
    codec::to_proto(std::vector<BookCopy>{{1, 2}}, request.mutable_batch());

    Folio::Protocol::Response response = Envelope(Dispatch(MessageType::BUY_BOOKS, request));
    EXPECT_FALSE(response.has_error());

    std::vector<int32_t> isbns = {1};
    EXPECT_EQ(store_->get_books_by_isbn(&isbns)[0].num_copies, 1);
}

TEST_F(BookStoreRpcTest, ApplicationErrorIsEmbedded) {
    Folio::Protocol::BuyBooks::Request request;
    codec::to_proto(std::vector<BookCopy>{{1, 9}}, request.mutable_batch());

    Folio::Protocol::Response response = Envelope(Dispatch(MessageType::BUY_BOOKS, request));
    ASSERT_TRUE(response.has_error());
    EXPECT_EQ(response.error().kind(), Folio::Protocol::INSUFFICIENT_STOCK);
    EXPECT_NE(response.error().message().find("ISBN 1"), std::string::npos);
    EXPECT_EQ(response.stock_books_size(), 0);
}

TEST_F(BookStoreRpcTest, AbsentBatchIsNullInput) {
    Folio::Protocol::RateBooks::Request request;
    Folio::Protocol::Response response = Envelope(Dispatch(MessageType::RATE_BOOKS, request));
    ASSERT_TRUE(response.has_error());
    EXPECT_EQ(response.error().kind(), Folio::Protocol::NULL_OR_EMPTY_INPUT);
}

TEST_F(BookStoreRpcTest, EmptyRatingBatchSucceeds) {
    Folio::Protocol::RateBooks::Request request;
    request.mutable_batch();
    Folio::Protocol::Response response = Envelope(Dispatch(MessageType::RATE_BOOKS, request));
    EXPECT_FALSE(response.has_error());
}

TEST_F(BookStoreRpcTest, BodylessQueries) {
    RpcReply reply;
    rpc_.handle_rpc(1, static_cast<uint32_t>(MessageType::LIST_BOOKS), "", reply);
    Folio::Protocol::Response response = Envelope(reply);
    EXPECT_EQ(response.stock_books_size(), 2);
    EXPECT_EQ(response.books_size(), 0);

    RpcReply demand;
    rpc_.handle_rpc(1, static_cast<uint32_t>(MessageType::GET_BOOKS_IN_DEMAND), "", demand);
    EXPECT_EQ(Envelope(demand).stock_books_size(), 0);
}

TEST_F(BookStoreRpcTest, CountQueries) {
    Folio::Protocol::CountQuery request;
    request.set_count(1);
    Folio::Protocol::Response response = Envelope(Dispatch(MessageType::GET_TOP_RATED_BOOKS, request));
    ASSERT_EQ(response.books_size(), 1);
    EXPECT_EQ(response.books(0).isbn(), 1);

    request.set_count(-1);
    Folio::Protocol::Response rejected = Envelope(Dispatch(MessageType::GET_EDITOR_PICKS, request));
    ASSERT_TRUE(rejected.has_error());
    EXPECT_EQ(rejected.error().kind(), Folio::Protocol::INVALID_ARGUMENT);
}

TEST_F(BookStoreRpcTest, GetBooksReturnsPublicView) {
    Folio::Protocol::IsbnQuery request;
    codec::to_proto(std::vector<int32_t>{2}, request.mutable_batch());
    Folio::Protocol::Response response = Envelope(Dispatch(MessageType::GET_BOOKS, request));
    ASSERT_EQ(response.books_size(), 1);
    EXPECT_EQ(response.books(0).title(), "Title 2");
    EXPECT_EQ(response.stock_books_size(), 0);
}

TEST_F(BookStoreRpcTest, UnknownTagIsRejectedAsText) {
    RpcReply reply;
    rpc_.handle_rpc(1, 99, "", reply);
    EXPECT_EQ(reply.status, status::kBadRequest);
    EXPECT_EQ(reply.content_type, ContentType::TEXT);
    EXPECT_NE(reply.payload.find("99"), std::string::npos);

    RpcReply unknown;
    rpc_.handle_rpc(1, 0, "", unknown);
    EXPECT_EQ(unknown.status, status::kBadRequest);
}

TEST_F(BookStoreRpcTest, MalformedBodyIsRejectedAsText) {
    RpcReply reply;
    rpc_.handle_rpc(1, static_cast<uint32_t>(MessageType::ADD_BOOKS), std::string("\xff\xff\xff", 3), reply);
    EXPECT_EQ(reply.status, status::kBadRequest);
    EXPECT_EQ(reply.content_type, ContentType::TEXT);
    EXPECT_NE(reply.payload.find("Malformed"), std::string::npos);
    EXPECT_EQ(store_->size(), 2u);
}
