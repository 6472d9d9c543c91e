#include <gtest/gtest.h>

#include <set>
#include <string>

#include "../common/codec.hh"
#include "../common/errors.hh"
#include "../common/message.hh"
#include "test_util.hh"

TEST(CodecTest, WireSchemaIsRegistered) {
    EXPECT_NO_THROW(codec::verify_wire_schema());
    EXPECT_EQ(codec::schema_fingerprint(), codec::schema_fingerprint());
}

TEST(CodecTest, WireTypesAreUnique) {
    std::set<std::string> names;
    for (size_t i = 0; i < codec::kWireTypeCount; ++i) {
        EXPECT_TRUE(names.insert(codec::kWireTypes[i]).second) << codec::kWireTypes[i];
    }
}

TEST(CodecTest, StockBookSurvivesTheWire) {
    StockBook book = TestBook(12, 3, true);
    book.num_sale_misses = 4;
    book.total_rating = 9;
    book.num_times_rated = 2;

    Folio::Protocol::Response response;
    codec::set_stock_books({book}, &response);
    Folio::Protocol::Response decoded;
    ASSERT_TRUE(decoded.ParseFromString(response.SerializeAsString()));

    std::vector<StockBook> books = codec::stock_books_of(decoded);
    ASSERT_EQ(books.size(), 1u);
    EXPECT_EQ(books[0].isbn, 12);
    EXPECT_EQ(books[0].title, book.title);
    EXPECT_EQ(books[0].author, book.author);
    EXPECT_FLOAT_EQ(books[0].price, book.price);
    EXPECT_EQ(books[0].num_copies, 3);
    EXPECT_EQ(books[0].num_sale_misses, 4);
    EXPECT_EQ(books[0].total_rating, 9);
    EXPECT_EQ(books[0].num_times_rated, 2);
    EXPECT_TRUE(books[0].editor_pick);
}

TEST(CodecTest, AbsentBatchDiffersFromEmptyBatch) {
    Folio::Protocol::BuyBooks::Request absent;
    Folio::Protocol::BuyBooks::Request empty;
    codec::to_proto(std::vector<BookCopy>{}, empty.mutable_batch());

    Folio::Protocol::BuyBooks::Request decoded_absent;
    Folio::Protocol::BuyBooks::Request decoded_empty;
    ASSERT_TRUE(decoded_absent.ParseFromString(absent.SerializeAsString()));
    ASSERT_TRUE(decoded_empty.ParseFromString(empty.SerializeAsString()));
    EXPECT_FALSE(decoded_absent.has_batch());
    EXPECT_TRUE(decoded_empty.has_batch());
    EXPECT_TRUE(codec::from_proto(decoded_empty.batch()).empty());
}

TEST(CodecTest, ErrorKeepsKindMessageAndCause) {
    Folio::Protocol::Error error;
    codec::encode_error(FolioError(ErrorKind::INVALID_RATING, "Rating 9 for ISBN 3 is outside [0,5]", "bad input"),
                        &error);
    try {
        codec::raise_remote_error(error);
        FAIL() << "raise_remote_error returned";
    } catch (const RemoteApplicationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_RATING);
        EXPECT_STREQ(e.what(), "Rating 9 for ISBN 3 is outside [0,5]");
        EXPECT_EQ(e.cause(), "bad input");
    }
}

TEST(CodecTest, EveryApplicationKindMapsBack) {
    for (ErrorKind kind : {ErrorKind::INVALID_ISBN, ErrorKind::DUPLICATE_ISBN, ErrorKind::INVALID_RATING,
                           ErrorKind::INVALID_QUANTITY, ErrorKind::INSUFFICIENT_STOCK,
                           ErrorKind::NULL_OR_EMPTY_INPUT, ErrorKind::INVALID_ARGUMENT, ErrorKind::INTERNAL}) {
        EXPECT_EQ(codec::from_proto(codec::to_proto(kind)), kind) << ErrorKindToString(kind);
    }
    EXPECT_EQ(codec::to_proto(ErrorKind::NETWORK), Folio::Protocol::INTERNAL);
    EXPECT_EQ(codec::from_proto(Folio::Protocol::ERROR_KIND_UNSPECIFIED), ErrorKind::INTERNAL);
}

TEST(MessageTest, TagTable) {
    EXPECT_FALSE(IsKnownMessageType(0));
    EXPECT_TRUE(IsKnownMessageType(static_cast<uint32_t>(MessageType::ADD_BOOKS)));
    EXPECT_TRUE(IsKnownMessageType(static_cast<uint32_t>(MessageType::GET_BOOKS_IN_DEMAND)));
    EXPECT_FALSE(IsKnownMessageType(99));

    EXPECT_EQ(MethodOf(MessageType::BUY_BOOKS), RequestMethod::WRITE);
    EXPECT_EQ(MethodOf(MessageType::REMOVE_ALL_BOOKS), RequestMethod::WRITE);
    EXPECT_EQ(MethodOf(MessageType::GET_TOP_RATED_BOOKS), RequestMethod::READ);
    EXPECT_EQ(MethodOf(MessageType::GET_STOCK_BOOKS_BY_ISBN), RequestMethod::READ);

    EXPECT_TRUE(IsBodyless(MessageType::LIST_BOOKS));
    EXPECT_TRUE(IsBodyless(MessageType::GET_BOOKS_IN_DEMAND));
    EXPECT_FALSE(IsBodyless(MessageType::GET_EDITOR_PICKS));
}

TEST(MessageTest, HeaderByteOrderRoundTrip) {
    MessageHeader header{};
    header.sender_id = 0x0102030405060708ull;
    header.message_type = 11;
    header.payload_size = 512;
    header.status = 400;
    header.content_type = 2;
    header.schema_version = 0xBEEF;

    MessageHeader back = ToHostOrder(ToNetworkOrder(header));
    EXPECT_EQ(back.sender_id, header.sender_id);
    EXPECT_EQ(back.message_type, header.message_type);
    EXPECT_EQ(back.payload_size, header.payload_size);
    EXPECT_EQ(back.status, header.status);
    EXPECT_EQ(back.content_type, header.content_type);
    EXPECT_EQ(back.schema_version, header.schema_version);
}

TEST(ErrorsTest, ProtocolErrorKeepsBoundedExcerpt) {
    std::string body(1000, 'x');
    ProtocolError error("Remote server rejected BUY_BOOKS", 400, body);
    EXPECT_EQ(error.kind(), ErrorKind::PROTOCOL);
    EXPECT_EQ(error.status(), 400u);
    EXPECT_EQ(error.body_excerpt().size(), ProtocolError::kMaxBodyExcerpt);
    EXPECT_NE(std::string(error.what()).find("(status 400)"), std::string::npos);
}

TEST(ErrorsTest, KindNamesAreDistinct) {
    const ErrorKind kinds[] = {ErrorKind::INVALID_ISBN,     ErrorKind::DUPLICATE_ISBN,
                               ErrorKind::INVALID_RATING,   ErrorKind::INVALID_QUANTITY,
                               ErrorKind::INSUFFICIENT_STOCK, ErrorKind::NULL_OR_EMPTY_INPUT,
                               ErrorKind::INVALID_ARGUMENT, ErrorKind::INTERNAL,
                               ErrorKind::NETWORK,          ErrorKind::PROTOCOL};
    for (ErrorKind a : kinds) {
        for (ErrorKind b : kinds) {
            if (a == b) {
                EXPECT_STREQ(ErrorKindToString(a), ErrorKindToString(b));
            } else {
                EXPECT_STRNE(ErrorKindToString(a), ErrorKindToString(b));
            }
        }
    }
    EXPECT_STREQ(ErrorKindToString(ErrorKind::INSUFFICIENT_STOCK), std::string("InsufficientStock").c_str());
}
