#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <rosewire/rosewire.h>

using namespace rosewire;
using namespace rosewire::api;

class Timer
{
public:
    explicit Timer(const char* label) :
        label_(label),
        start_(std::chrono::steady_clock::now()) {}

    ~Timer()
    {
        auto end = std::chrono::steady_clock::now();
        std::chrono::duration<double> duration = end - start_;
        std::cout << label_ << ": " << duration.count() << " seconds\n";
    }

private:
    const char* label_;
    std::chrono::steady_clock::time_point start_;
};

static Block makeBlock(int txCount)
{
    Block block;
    block.blockIdentifier = { "0x8f1c0b3e9a7d", 12'345'678 };
    block.parentBlockIdentifier = { "0x3c2b1a09f8e7", 12'345'677 };
    block.timestamp = 1'600'000'000'000;
    MapObject ong = MapObject::from({
        { "contract", "0200000000000000000000000000000000000000" } });
    for (int i = 0; i < txCount; i++)
    {
        Transaction& tx = block.transactions.emplace_back();
        tx.transactionIdentifier.hash = "0x" + std::to_string(1'000'000 + i);
        for (int j = 0; j < 2; j++)
        {
            Operation& op = tx.operations.emplace_back();
            op.operationIdentifier.index = j;
            op.type = "transfer";
            op.status = std::string("SUCCESS");
            op.account.set().address = "AFmseVrdL9f9oyCzZefL9tG6UbvhPbdYzM";
            Amount& amount = op.amount.set();
            amount.value = j == 0 ? "-50000000" : "50000000";
            amount.currency.symbol = "ONG";
            amount.currency.decimals = 9;
            amount.currency.metadata = ong;
        }
    }
    return block;
}

int main()
{
    constexpr int ROUNDS = 20'000;
    Block block = makeBlock(50);
    Buffer buf(64 * 1024);
    size_t bytes = 0;
    {
        Timer timer("Block encoding");
        for (int i = 0; i < ROUNDS; i++)
        {
            buf.clear();
            block.encodeJson(buf);
            bytes += buf.length();
        }
    }
    printf("Encoded %zu bytes (%zu per block)\n", bytes, buf.length());

    MapObject a = MapObject::from({ { "contract", "02" }, { "decimals", 9 } });
    MapObject b = MapObject::from({ { "decimals", 9 }, { "contract", "02" } });
    int equal = 0;
    {
        Timer timer("MapObject equality");
        for (int i = 0; i < ROUNDS * 100; i++)
        {
            equal += a == b;
        }
    }
    printf("%d of %d comparisons equal\n", equal, ROUNDS * 100);
    return 0;
}
