#pragma once

#include <arrayproxy/types/array_observer.h>

#include <optional>
#include <string>
#include <vector>

namespace arrayproxy {

    /**
     * @brief Logs out the range changes of the arrays it watches.
     *
     * This is voluminous but can be helpful tracing down unexpected notification order, for example when debugging
     * a chain of proxies. Each line carries the trace label, the phase (will / did), the change triple and the
     * current length of the source.
     */
    class ARRAYPROXY_EXPORT ArrayChangeTrace : public ArrayObserver {
    public:
        /**
         * @brief Construct a new Array Change Trace object
         *
         * @param label Prefix for every line, identifies the watched array(s)
         * @param filter Used to restrict which labels are reported (substring match)
         * @param will Log will-change events
         * @param did Log did-change events
         */
        explicit ArrayChangeTrace(std::string label, const std::optional<std::string>& filter = std::nullopt,
                                  bool will = true, bool did = true);

        ~ArrayChangeTrace() override;

        ArrayChangeTrace(const ArrayChangeTrace&) = delete;
        ArrayChangeTrace& operator=(const ArrayChangeTrace&) = delete;

        /**
         * @brief Start observing array, the registration is removed again when the trace is destroyed.
         */
        void watch(ObservableArray& array);

        void unwatch(ObservableArray& array);

        void array_will_change(ObservableArray& source, const ArrayChange& change) override;
        void array_did_change(ObservableArray& source, const ArrayChange& change) override;

        [[nodiscard]] size_t lines_written() const { return _lines_written; }

        // Static configuration
        static void set_use_logger(bool value);

    private:
        std::string _label;
        std::optional<std::string> _filter;
        bool _will;
        bool _did;
        size_t _lines_written{0};
        std::vector<ObservableArray*> _watched;

        static bool _use_logger;

        void _print(const std::string& msg);
        [[nodiscard]] bool _should_log() const;
    };

} // namespace arrayproxy
