#pragma once

/**
 * @file array_proxy.h
 * @brief ArrayProxy - an array that forwards to a swappable content array.
 *
 * An ArrayProxy wraps any other ObservableArray and forwards all requests to it. This makes it useful wherever the
 * underlying array needs to be swapped out without observers of the proxy having to re-subscribe.
 *
 * @code
 * auto pets  = make_native_array({make_value("dog"), make_value("cat"), make_value("fish")});
 * auto proxy = create<ArrayProxy>(pets.get());
 *
 * proxy->first_object();   // "dog"
 *
 * auto protozoa = make_native_array({make_value("amoeba"), make_value("paramecium")});
 * proxy->set_content(protozoa.get());
 * proxy->first_object();   // "amoeba"
 * @endcode
 *
 * Subclasses can transform elements as they are read by overriding object_at_content, or present a different view
 * (sorted, filtered, ...) by overriding arranged_content. The proxy listens to the arranged view, not to the raw
 * content, and re-broadcasts every range change it receives as its own.
 *
 * Swapping the arranged view is reported to observers as a full-range replace: will(0, old_length, undefined)
 * before the swap and did(0, undefined, new_length) after it.
 */

#include <arrayproxy/arrayproxy_forward_declarations.h>
#include <arrayproxy/types/mutable_array.h>

#include <functional>

namespace arrayproxy {

class ARRAYPROXY_EXPORT ArrayProxy : public MutableArray {
public:
    /**
     * @param content Initial content, not owned. The subscription is established by init, so construct through
     *                create<> (or call initialise_object) before use.
     */
    explicit ArrayProxy(ObservableArray* content = nullptr);

    ~ArrayProxy() override;

    // ========== Content ==========

    /**
     * @brief The wrapped array, or null.
     */
    [[nodiscard]] ObservableArray* content() const { return content_; }

    /**
     * @brief Swap the wrapped array.
     *
     * Assigning the current content again is a no-op. Once initialised, the swap is bracketed by full-range will and
     * did notifications and the subscription moves from the previous arranged view to the new one.
     *
     * @throws PreconditionViolation when content is the proxy itself (nothing changes), when called while a swap or
     *         a forwarded change is in progress, when the proxy is destroyed, or when the new arranged view is
     *         rejected (see init)
     */
    void set_content(ObservableArray* content);

    /**
     * @brief The array the proxy pretends to be.
     *
     * In the default implementation this and content are the same. Subclasses can override this to provide things
     * like sorting and filtering. The identity comparison arranged_content() == content() decides whether the proxy
     * may be mutated through replace.
     */
    [[nodiscard]] virtual ObservableArray* arranged_content() const { return content_; }

    /**
     * @brief The array the proxy is currently subscribed to, null when unbound.
     */
    [[nodiscard]] ObservableArray* subscribed_content() const { return subscribed_; }

    [[nodiscard]] bool is_bound() const { return subscribed_ != nullptr; }

    // ========== Array ==========

    /**
     * @return An empty value when there is no content, otherwise object_at_content(idx)
     */
    [[nodiscard]] Value object_at(size_t idx) const override;

    /**
     * @return The length of the arranged content, 0 when there is none
     */
    [[nodiscard]] size_t length() const override;

    /**
     * @throws PreconditionViolation when arranged_content() is not content(), mutating through a transformed view
     *         would apply indexes of the view to the raw content
     */
    void replace(size_t idx, size_t amt, const std::vector<Value>& objects) override;

    // ========== Arranged content notifications ==========

    /**
     * Called before the arranged content changes, both for range changes reported by the arranged content and for
     * the synthetic full-range change of a swap (source is then the proxy itself). The default re-emits the change
     * as the proxy's own; overrides should call the base implementation.
     */
    virtual void arranged_content_array_will_change(ObservableArray& source, const ArrayChange& change);

    virtual void arranged_content_array_did_change(ObservableArray& source, const ArrayChange& change);

protected:
    /**
     * Should actually retrieve the object at the specified index from the arranged content. Override to transform
     * the element. Only called when content is non-null.
     */
    [[nodiscard]] virtual Value object_at_content(size_t idx) const;

    /**
     * Should actually replace the specified objects on the content array. Only called when content is non-null.
     *
     * @throws PreconditionViolation when the content can not be mutated
     */
    virtual void replace_content(size_t idx, size_t amt, const std::vector<Value>& objects);

    /**
     * Swap the arranged view: announce the full-range will-change, detach, run store, attach to the new arranged
     * view and announce the full-range did-change. Subclasses use this when their derived view changes for a
     * reason other than set_content.
     */
    void change_arranged_content(const std::function<void()>& store);

    void init() override;

    void will_destroy() override;

private:
    /**
     * Subscription target registered with the arranged content. Delivers the arranged content's range changes to
     * the proxy's overridable notification hooks.
     */
    class ContentForwarder : public ArrayObserver {
    public:
        explicit ContentForwarder(ArrayProxy& proxy) : proxy_(proxy) {}

        void array_will_change(ObservableArray& source, const ArrayChange& change) override;

        void array_did_change(ObservableArray& source, const ArrayChange& change) override;

    private:
        ArrayProxy& proxy_;
    };

    void arranged_content_will_change();

    void arranged_content_did_change();

    [[nodiscard]] size_t arranged_length() const;

    void setup_arranged_content();

    void teardown_arranged_content();

    ObservableArray* content_{nullptr};
    ObservableArray* subscribed_{nullptr};
    ContentForwarder forwarder_{*this};
    bool swapping_{false};
    size_t pending_changes_{0};
};

}  // namespace arrayproxy
