#include "common/Uuid.h"
#include "network/RequestSigner.h"

#include <cassert>
#include <iostream>
#include <set>

using namespace tradesync;
using tradesync::network::RequestSigner;

int main() {
    // Published Binance HMAC example
    const std::string secret = "NhqPtmdSJYdKjVHjA7PZj4Mge3R5YNiP1e3UZjInClVN65XAbvqqM6A7H5fATj0j";
    const std::string query =
        "symbol=LTCBTC&side=BUY&type=LIMIT&timeInForce=GTC&quantity=1&price=0.1"
        "&recvWindow=5000&timestamp=1499827319559";
    assert(RequestSigner::sign(secret, query) ==
           "c8db56825ae71d6d79447849e617115f4a920fa2acdcab2b053c4b2838bd6b71");
    assert(RequestSigner::sign(secret, query + "x") != RequestSigner::sign(secret, query));

    const auto built = RequestSigner::buildQueryString({
        {"symbol", "BTCUSDT"},
        {"side", "SELL"},
        {"newClientOrderId", "x-abc_1"},
        {"quantity", "0.001"},
    });
    assert(built == "newClientOrderId=x-abc_1&quantity=0.001&side=SELL&symbol=BTCUSDT");
    assert(RequestSigner::buildQueryString({}).empty());

    assert(RequestSigner::urlEncode("a b/c:d") == "a%20b%2Fc%3Ad");
    assert(RequestSigner::urlEncode("[\"BTCUSDT\"]") == "%5B%22BTCUSDT%22%5D");

    // Trade ids double as entry client order ids
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        const auto id = utils::generateUUID();
        assert(id.size() == 36);
        assert(id[14] == '4');
        assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
        ids.insert(id);
    }
    assert(ids.size() == 100);

    std::cout << "[TEST] RequestSigner PASSED\n";
    return 0;
}
