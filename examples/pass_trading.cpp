// Podium - Pass Trading Example
//
// Usage: pass_trading [config.json]

#include <podium/podium.hpp>

#include <exception>
#include <string>

using namespace podium;
using namespace podium::observability;

namespace {

constexpr Amount FUNDING = 100 * constants::OCTA;

void buy(Protocol& protocol, const char* who, const Address& buyer, const Address& target) {
    BuyResult result = protocol.buy_pass(buyer, target, 1);
    log_info("bought pass", {string_field("buyer", who), uint_field("price", result.split.base),
                             uint_field("paid", result.total_paid),
                             uint_field("supply", result.new_supply)});
}

void print_stats(const Protocol& protocol, const char* label, const Address& target) {
    PassStats stats = protocol.get_pass_stats(target);
    log_info("pass stats", {string_field("target", label),
                            uint_field("total_supply", stats.total_supply),
                            uint_field("last_price", stats.last_price),
                            uint_field("next_price", protocol.calculate_buy_price(target, 1))});
}

} // namespace

int main(int argc, char** argv) {
    PodiumConfig config;
    try {
        if (argc > 1) {
            config = PodiumConfig::from_file(argv[1]);
        } else {
            config.protocol = ProtocolConfig::create(address_from_hex("0xad"), address_from_hex("0x7e"));
        }
    } catch (const std::exception& e) {
        initialize_logging(config.logging);
        log_error("failed to load config", {string_field("error", e.what())});
        return 1;
    }

    initialize_logging(config.logging);

    MemoryCoinBank bank;
    MemoryPassStore passes;
    SystemClock clock;
    LoggingEventSink events;

    try {
        Protocol protocol(config.protocol, bank, passes, clock, events);

        Address user1 = address_from_hex("0x1001");
        Address user2 = address_from_hex("0x1002");
        Address target = address_from_hex("0x2001");
        bank.mint(user1, FUNDING);
        bank.mint(user2, FUNDING);

        log_info("user1 buying passes from target");
        for (int i = 0; i < 3; ++i) buy(protocol, "user1", user1, target);

        log_info("user2 buying passes from target");
        for (int i = 0; i < 2; ++i) buy(protocol, "user2", user2, target);

        log_info("user1 selling a pass");
        SellResult sold = protocol.sell_pass(user1, target, 1);
        log_info("sold pass", {uint_field("price", sold.split.price),
                               uint_field("net", sold.split.net_to_seller),
                               uint_field("supply", sold.new_supply)});

        log_info("user1 acting as its own target");
        buy(protocol, "user2", user2, user1);

        log_info("several targets at once");
        buy(protocol, "user2", user2, target);
        buy(protocol, "user2", user2, user1);

        print_stats(protocol, "target", target);
        print_stats(protocol, "user1", user1);
        log_info("vault", {uint_field("balance", protocol.vault_balance()),
                           uint_field("treasury", bank.balance(protocol.config().treasury))});
    } catch (const PodiumError& e) {
        log_error("scenario failed", {string_field("kind", to_string(e.kind())),
                                      string_field("error", e.what())});
        shutdown_logging();
        return 1;
    } catch (const std::exception& e) {
        log_error("scenario failed", {string_field("error", e.what())});
        shutdown_logging();
        return 1;
    }

    shutdown_logging();
    return 0;
}
