#include "config/config_loader.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

namespace dnmm {

namespace {

// Minimal JSON value for config loading (no external deps)
struct JsonValue {
    enum Type { Null, Bool, Number, String, Array, Object };
    Type type = Null;
    bool boolean = false;
    double number = 0;
    std::string str;
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    const JsonValue* find(const std::string& key) const {
        for (const auto& [k, v] : obj) {
            if (k == key) return &v;
        }
        return nullptr;
    }
    const JsonValue* get_object(const std::string& key) const {
        auto* v = find(key);
        return (v && v->type == Object) ? v : nullptr;
    }
};

// Recursive descent parser. Stops at the first malformed token and reports
// its offset.
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input) {}

    Result<JsonValue> parse() {
        JsonValue root = parse_value();
        skip_ws();
        if (failed_) return make_error(ErrorCode::InvalidConfig, error_, static_cast<double>(pos_));
        if (pos_ != input_.size()) {
            return make_error(ErrorCode::InvalidConfig, "trailing characters after JSON value",
                              static_cast<double>(pos_));
        }
        return root;
    }

private:
    const std::string& input_;
    size_t pos_ = 0;
    bool failed_ = false;
    std::string error_;

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() { return pos_ < input_.size() ? input_[pos_++] : '\0'; }
    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }
    JsonValue fail(std::string message) {
        if (!failed_) {
            failed_ = true;
            error_ = std::move(message);
        }
        return JsonValue{};
    }
    bool expect(char c) {
        skip_ws();
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
            return false;
        }
        ++pos_;
        return true;
    }
    bool literal(const char* word) {
        size_t len = std::char_traits<char>::length(word);
        if (input_.compare(pos_, len, word) != 0) return false;
        pos_ += len;
        return true;
    }

    JsonValue parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') return parse_string();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        JsonValue v;
        if (literal("null")) return v;
        if (literal("true")) {
            v.type = JsonValue::Bool;
            v.boolean = true;
            return v;
        }
        if (literal("false")) {
            v.type = JsonValue::Bool;
            return v;
        }
        return fail("unexpected character");
    }

    JsonValue parse_string() {
        if (!expect('"')) return JsonValue{};
        JsonValue v;
        v.type = JsonValue::String;
        while (peek() != '"') {
            if (peek() == '\0') return fail("unterminated string");
            if (peek() == '\\') next();
            v.str += next();
        }
        next();
        return v;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') next();
        while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        if (peek() == '.') { next(); while (std::isdigit(static_cast<unsigned char>(peek()))) next(); }
        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        }
        std::string text = input_.substr(start, pos_ - start);
        if (text.empty() || text == "-") return fail("malformed number");

        JsonValue v;
        v.type = JsonValue::Number;
        v.number = std::strtod(text.c_str(), nullptr);
        return v;
    }

    JsonValue parse_array() {
        next(); // [
        JsonValue v;
        v.type = JsonValue::Array;
        skip_ws();
        if (peek() == ']') { next(); return v; }
        while (!failed_) {
            v.arr.push_back(parse_value());
            skip_ws();
            if (peek() != ',') break;
            next();
        }
        expect(']');
        return v;
    }

    JsonValue parse_object() {
        next(); // {
        JsonValue v;
        v.type = JsonValue::Object;
        skip_ws();
        if (peek() == '}') { next(); return v; }
        while (!failed_) {
            auto key = parse_string();
            if (!expect(':')) break;
            auto val = parse_value();
            v.obj.emplace_back(key.str, std::move(val));
            skip_ws();
            if (peek() != ',') break;
            next();
        }
        expect('}');
        return v;
    }
};

// Field readers. A key of the wrong type is an error rather than a silent default.
class SectionReader {
public:
    SectionReader(const JsonValue* section, std::string name)
        : section_(section), name_(std::move(name)) {}

    void number(const char* key, double& out) {
        if (auto* v = lookup(key, JsonValue::Number)) out = v->number;
    }
    void amount(const char* key, uint64_t& out) {
        integer(key, out, std::numeric_limits<uint64_t>::max());
    }
    void count(const char* key, uint32_t& out) {
        uint64_t wide = out;
        integer(key, wide, std::numeric_limits<uint32_t>::max());
        out = static_cast<uint32_t>(wide);
    }
    void count(const char* key, size_t& out) {
        uint64_t wide = out;
        integer(key, wide, std::numeric_limits<size_t>::max());
        out = static_cast<size_t>(wide);
    }
    void flag(const char* key, bool& out) {
        if (auto* v = lookup(key, JsonValue::Bool)) out = v->boolean;
    }
    void text(const char* key, std::string& out) {
        if (auto* v = lookup(key, JsonValue::String)) out = v->str;
    }
    void strings(const char* key, std::vector<std::string>& out) {
        auto* v = lookup(key, JsonValue::Array);
        if (!v) return;
        out.clear();
        for (const auto& item : v->arr) {
            if (item.type != JsonValue::String) {
                mismatch(key, "an array of strings");
                return;
            }
            out.push_back(item.str);
        }
    }

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

private:
    const JsonValue* lookup(const char* key, JsonValue::Type type) {
        if (!section_) return nullptr;
        auto* v = section_->find(key);
        if (!v) return nullptr;
        if (v->type != type) {
            mismatch(key, "a different type");
            return nullptr;
        }
        return v;
    }
    // 2^64 is exact as a double; anything at or above it does not fit.
    void integer(const char* key, uint64_t& out, uint64_t max) {
        auto* v = lookup(key, JsonValue::Number);
        if (!v) return;
        if (v->number < 0.0 || v->number != std::floor(v->number)) {
            mismatch(key, "a non-negative integer");
            return;
        }
        if (v->number >= 18446744073709551616.0 || static_cast<uint64_t>(v->number) > max) {
            mismatch(key, "an integer in range");
            return;
        }
        out = static_cast<uint64_t>(v->number);
    }
    void mismatch(const char* key, const char* wanted) {
        if (error_.empty()) error_ = name_ + "." + key + " must be " + wanted;
    }

    const JsonValue* section_;
    std::string      name_;
    std::string      error_;
};

Result<void> read_pool(const JsonValue& root, PoolConfig& config) {
    SectionReader oracle(root.get_object("oracle"), "oracle");
    oracle.number("max_age_sec", config.oracle.max_age_sec);
    oracle.number("secondary_max_age_sec", config.oracle.secondary_max_age_sec);
    oracle.number("secondary_max_age_sec_strict", config.oracle.secondary_max_age_sec_strict);
    oracle.flag("allow_ema_fallback", config.oracle.allow_ema_fallback);
    oracle.number("conf_cap_bps_spot", config.oracle.conf_cap_bps_spot);
    oracle.number("conf_cap_bps_strict", config.oracle.conf_cap_bps_strict);
    oracle.number("conf_weight_spread_bps", config.oracle.conf_weight_spread_bps);
    oracle.number("conf_weight_sigma_bps", config.oracle.conf_weight_sigma_bps);
    oracle.number("conf_weight_secondary_bps", config.oracle.conf_weight_secondary_bps);
    oracle.number("sigma_ewma_lambda_bps", config.oracle.sigma_ewma_lambda_bps);

    SectionReader divergence(root.get_object("divergence"), "divergence");
    divergence.number("divergence_bps", config.divergence.divergence_bps);
    divergence.number("accept_bps", config.divergence.accept_bps);
    divergence.number("soft_bps", config.divergence.soft_bps);
    divergence.number("hard_bps", config.divergence.hard_bps);
    divergence.number("haircut_min_bps", config.divergence.haircut_min_bps);
    divergence.number("haircut_slope_bps", config.divergence.haircut_slope_bps);
    divergence.count("healthy_frames", config.divergence.healthy_frames);

    SectionReader fee(root.get_object("fee"), "fee");
    fee.number("base_bps", config.fee.base_bps);
    fee.number("alpha_conf_num", config.fee.alpha_conf_num);
    fee.number("alpha_conf_den", config.fee.alpha_conf_den);
    fee.number("beta_inv_dev_num", config.fee.beta_inv_dev_num);
    fee.number("beta_inv_dev_den", config.fee.beta_inv_dev_den);
    fee.number("cap_bps", config.fee.cap_bps);
    fee.number("decay_pct_per_block", config.fee.decay_pct_per_block);
    fee.number("size_lin_bps", config.fee.size_lin_bps);
    fee.number("size_quad_bps", config.fee.size_quad_bps);
    fee.number("size_fee_cap_bps", config.fee.size_fee_cap_bps);
    fee.number("kappa_lvr_bps", config.fee.kappa_lvr_bps);
    fee.number("lvr_cap_bps", config.fee.lvr_cap_bps);

    SectionReader maker(root.get_object("maker"), "maker");
    maker.number("s0_notional", config.maker.s0_notional);
    maker.number("ttl_ms", config.maker.ttl_ms);
    maker.number("alpha_bbo_bps", config.maker.alpha_bbo_bps);
    maker.number("beta_floor_bps", config.maker.beta_floor_bps);

    SectionReader inventory(root.get_object("inventory"), "inventory");
    inventory.amount("base_floor", config.inventory.base_floor);
    inventory.amount("quote_floor", config.inventory.quote_floor);
    inventory.number("floor_bps", config.inventory.floor_bps);
    inventory.number("recenter_threshold_bps", config.inventory.recenter_threshold_bps);
    inventory.number("recenter_min_change_bps", config.inventory.recenter_min_change_bps);
    inventory.amount("recenter_cooldown_sec", config.inventory.recenter_cooldown_sec);
    inventory.count("recenter_healthy_frames", config.inventory.recenter_healthy_frames);
    inventory.number("inv_tilt_bps_per_1pct", config.inventory.inv_tilt_bps_per_1pct);
    inventory.number("inv_tilt_max_bps", config.inventory.inv_tilt_max_bps);
    inventory.number("tilt_conf_weight_bps", config.inventory.tilt_conf_weight_bps);
    inventory.number("tilt_spread_weight_bps", config.inventory.tilt_spread_weight_bps);

    SectionReader aomq(root.get_object("aomq"), "aomq");
    aomq.number("min_quote_notional", config.aomq.min_quote_notional);
    aomq.number("emergency_spread_bps", config.aomq.emergency_spread_bps);
    aomq.number("floor_epsilon_bps", config.aomq.floor_epsilon_bps);
    aomq.number("toxicity_bias_bps", config.aomq.toxicity_bias_bps);

    SectionReader preview(root.get_object("preview"), "preview");
    preview.amount("max_age_sec", config.preview.max_age_sec);
    preview.amount("snapshot_cooldown_sec", config.preview.snapshot_cooldown_sec);
    preview.flag("revert_on_stale_preview", config.preview.revert_on_stale_preview);

    SectionReader rebates(root.get_object("rebates"), "rebates");
    rebates.number("rebate_bps", config.rebates.rebate_bps);
    rebates.strings("allowlist", config.rebates.allowlist);

    SectionReader flags(root.get_object("flags"), "flags");
    flags.flag("enable_soft_divergence", config.flags.enable_soft_divergence);
    flags.flag("enable_size_fee", config.flags.enable_size_fee);
    flags.flag("enable_bbo_floor", config.flags.enable_bbo_floor);
    flags.flag("enable_inv_tilt", config.flags.enable_inv_tilt);
    flags.flag("enable_aomq", config.flags.enable_aomq);
    flags.flag("enable_rebates", config.flags.enable_rebates);
    flags.flag("enable_auto_recenter", config.flags.enable_auto_recenter);
    flags.flag("enable_lvr_fee", config.flags.enable_lvr_fee);

    for (const SectionReader* r : {&oracle, &divergence, &fee, &maker, &inventory,
                                   &aomq, &preview, &rebates, &flags}) {
        if (!r->ok()) return make_error(ErrorCode::InvalidConfig, r->error());
    }
    return validate_config(config);
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return make_error(ErrorCode::InvalidConfig, "cannot open config file: " + path);
    }
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

Result<JsonValue> parse_root(const std::string& text) {
    auto root = JsonParser(text).parse();
    if (!root) return root.error();
    if (root->type != JsonValue::Object) {
        return make_error(ErrorCode::InvalidConfig, "config root must be an object");
    }
    return root;
}

} // anonymous namespace

Result<PoolConfig> parse_pool_config(const std::string& text) {
    auto root = parse_root(text);
    if (!root) return root.error();

    PoolConfig config;
    auto status = read_pool(*root, config);
    if (!status) return status.error();
    return config;
}

Result<PoolConfig> load_pool_config(const std::string& path) {
    auto text = read_file(path);
    if (!text) return text.error();
    return parse_pool_config(*text);
}

Result<SimulationConfig> parse_simulation_config(const std::string& text) {
    auto root = parse_root(text);
    if (!root) return root.error();

    SimulationConfig config;
    if (auto* pool = root->get_object("pool")) {
        auto status = read_pool(*pool, config.pool);
        if (!status) return status.error();
    }

    SectionReader reserves(root->get_object("reserves"), "reserves");
    reserves.amount("base_reserve", config.reserves.base_reserve);
    reserves.amount("quote_reserve", config.reserves.quote_reserve);
    reserves.amount("target_base", config.reserves.target_base);

    SectionReader sim(root->get_object("simulation"), "simulation");
    sim.count("steps", config.steps);
    sim.amount("seed", config.seed);
    sim.amount("seconds_per_step", config.seconds_per_step);
    sim.number("initial_mid", config.initial_mid);
    sim.number("price_vol_bps", config.price_vol_bps);
    sim.number("spread_bps", config.spread_bps);
    sim.number("secondary_noise_bps", config.secondary_noise_bps);
    sim.number("stale_probability", config.stale_probability);
    sim.number("divergence_probability", config.divergence_probability);
    sim.number("divergence_jump_bps", config.divergence_jump_bps);
    sim.number("swap_notional_mean", config.swap_notional_mean);
    sim.number("base_in_probability", config.base_in_probability);
    sim.text("report_path", config.report_path);
    sim.text("csv_path", config.csv_path);

    if (!reserves.ok()) return make_error(ErrorCode::InvalidConfig, reserves.error());
    if (!sim.ok()) return make_error(ErrorCode::InvalidConfig, sim.error());
    if (config.initial_mid <= 0.0) {
        return make_error(ErrorCode::InvalidConfig, "simulation.initial_mid", config.initial_mid, 0.0);
    }
    if (config.seconds_per_step == 0) {
        return make_error(ErrorCode::InvalidConfig, "simulation.seconds_per_step");
    }
    return config;
}

Result<SimulationConfig> load_simulation_config(const std::string& path) {
    auto text = read_file(path);
    if (!text) return text.error();
    return parse_simulation_config(*text);
}

} // namespace dnmm
