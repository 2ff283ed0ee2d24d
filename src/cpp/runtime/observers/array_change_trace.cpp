#include <arrayproxy/runtime/observers/array_change_trace.h>
#include <arrayproxy/types/observable_array.h>

#include <fmt/format.h>

#include <algorithm>
#include <iostream>

namespace arrayproxy {

    // Static member initialization
    bool ArrayChangeTrace::_use_logger = true;

    ArrayChangeTrace::ArrayChangeTrace(std::string label, const std::optional<std::string>& filter,
                                       bool will, bool did)
        : _label(std::move(label)), _filter(filter), _will(will), _did(did) {
    }

    ArrayChangeTrace::~ArrayChangeTrace() {
        for (auto* array : _watched) { array->remove_array_observer(this); }
    }

    void ArrayChangeTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void ArrayChangeTrace::watch(ObservableArray& array) {
        if (std::find(_watched.begin(), _watched.end(), &array) != _watched.end()) { return; }
        array.add_array_observer(this);
        _watched.push_back(&array);
    }

    void ArrayChangeTrace::unwatch(ObservableArray& array) {
        auto it = std::find(_watched.begin(), _watched.end(), &array);
        if (it == _watched.end()) { return; }
        array.remove_array_observer(this);
        _watched.erase(it);
    }

    void ArrayChangeTrace::array_will_change(ObservableArray& source, const ArrayChange& change) {
        if (_will && _should_log()) {
            _print(fmt::format("will {} length={}", change, source.length()));
        }
    }

    void ArrayChangeTrace::array_did_change(ObservableArray& source, const ArrayChange& change) {
        if (_did && _should_log()) {
            _print(fmt::format("did {} length={}", change, source.length()));
        }
    }

    void ArrayChangeTrace::_print(const std::string& msg) {
        std::string formatted = fmt::format("[{}] {}", _label, msg);
        if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
        ++_lines_written;
    }

    bool ArrayChangeTrace::_should_log() const {
        if (!_filter.has_value()) {
            return true;
        }
        return _label.find(_filter.value()) != std::string::npos;
    }

} // namespace arrayproxy
