#include "lru/store_shell.h"
#include "lru/lru_store_json.h"

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace lru {

namespace {

/// Malformed command line: unknown verb, missing or extra arguments.
class BadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string read_key(std::istringstream& args){
    std::string key;
    if(!(args >> key)){
        throw BadRequest("missing key");
    }
    return key;
}

void expect_end(std::istringstream& args){
    std::string extra;
    if(args >> extra){
        throw BadRequest("unexpected argument '" + extra + "'");
    }
}

json error_response(const std::string& code, const std::string& message){
    return json{{"error", message}, {"code", code}};
}

} // namespace

StoreShell::Store::capacity_type parse_capacity(const std::string& token){
    size_t pos = 0;
    long long capacity = std::stoll(token, &pos);
    if(pos != token.size()){
        throw std::invalid_argument("invalid capacity '" + token + "'");
    }
    return capacity;
}

bool is_quit_command(const std::string& line){
    std::istringstream words(line);
    std::string command;
    if(!(words >> command) || command != "quit"){
        return false;
    }
    std::string extra;
    return !(words >> extra);
}

StoreShell::StoreShell(std::shared_ptr<Store> store, LogHook log)
    : store_(std::move(store)), log_(std::move(log)) {}

void StoreShell::logCommand(const std::string& command, const std::string& status){
    if(log_){
        log_(command + " -> " + status);
    }
}

json StoreShell::execute(const std::string& line){
    std::istringstream args(line);
    std::string command;
    args >> command;

    json response;
    try {
        response = dispatch(command, args);
    } catch (const KeyNotFound& e) {
        if(command == "get" || command == "peek"){
            misses_++;
        }
        response = error_response("not_found", e.what());
    } catch (const EmptyStore& e) {
        response = error_response("empty", e.what());
    } catch (const InvalidCapacity& e) {
        response = error_response("invalid_capacity", e.what());
    } catch (const std::exception& e) {
        // BadRequest and argument conversion failures from parse_capacity
        response = error_response("bad_request", e.what());
    }

    logCommand(command.empty() ? "<empty>" : command,
               response.contains("code") ? response["code"].get<std::string>() : "ok");
    return response;
}

json StoreShell::dispatch(const std::string& command, std::istringstream& args){
    if(command == "put"){
        auto key = read_key(args);
        std::string value;
        std::getline(args >> std::ws, value);
        if(value.empty()){
            throw BadRequest("missing value");
        }
        store_->put(key, value);
        return json{{"status", "ok"}};
    }

    if(command == "get" || command == "peek"){
        auto key = read_key(args);
        expect_end(args);
        const std::string& value = command == "get" ? store_->get(key) : store_->peek(key);
        hits_++;
        return json{{"value", value}};
    }

    if(command == "del"){
        auto key = read_key(args);
        expect_end(args);
        store_->erase(key);
        return json{{"status", "deleted"}};
    }

    if(command == "has"){
        auto key = read_key(args);
        expect_end(args);
        return json{{"contains", store_->contains(key)}};
    }

    if(command == "resize"){
        std::string token;
        if(!(args >> token)){
            throw BadRequest("missing capacity");
        }
        expect_end(args);
        store_->resize(parse_capacity(token));
        return json{{"status", "ok"}, {"capacity", store_->capacity()}};
    }

    if(command == "lru" || command == "mru"){
        expect_end(args);
        const auto& key = command == "lru" ? store_->least_recently_used()
                                           : store_->most_recently_used();
        return json{{"key", key}};
    }

    if(command == "pop"){
        expect_end(args);
        auto entry = store_->pop_least_recently_used();
        return json{{"key", entry.first}, {"value", entry.second}};
    }

    if(command == "clear"){
        expect_end(args);
        store_->clear();
        return json{{"status", "cleared"}};
    }

    if(command == "keys"){
        expect_end(args);
        json keys = json::array();
        for(const auto& key : store_->keys()){
            keys.push_back(key);
        }
        return json{{"keys", keys}};
    }

    if(command == "dump"){
        expect_end(args);
        return json(*store_);
    }

    if(command == "stats"){
        expect_end(args);
        return json{
            {"hits", hits_},
            {"misses", misses_},
            {"filled", store_->filled()},
            {"capacity", store_->capacity()}
        };
    }

    if(command.empty()){
        throw BadRequest("empty command");
    }
    throw BadRequest("unknown command '" + command + "'");
}

size_t StoreShell::hits() const {
    return hits_;
}

size_t StoreShell::misses() const {
    return misses_;
}

} // namespace lru
