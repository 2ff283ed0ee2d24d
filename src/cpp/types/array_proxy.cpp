#include <arrayproxy/types/array_proxy.h>
#include <arrayproxy/util/errors.h>

#include <typeinfo>

namespace arrayproxy {

namespace {

struct SwapGuard {
    explicit SwapGuard(bool& flag) : flag_{flag} { flag_ = true; }
    ~SwapGuard() { flag_ = false; }

private:
    bool& flag_;
};

}  // namespace

ArrayProxy::ArrayProxy(ObservableArray* content) : content_(content) {}

ArrayProxy::~ArrayProxy() {
    // Released without destroy_object, make sure the arranged content does not keep a dangling observer
    teardown_arranged_content();
}

void ArrayProxy::set_content(ObservableArray* content) {
    if (content == content_) { return; }
    // Rejected up front so the current binding and content stay untouched
    check_precondition(content != this, "Can't set ArrayProxy's content to itself");
    change_arranged_content([this, content] { content_ = content; });
}

Value ArrayProxy::object_at(size_t idx) const { return content_ ? object_at_content(idx) : Value{}; }

size_t ArrayProxy::length() const { return arranged_length(); }

void ArrayProxy::replace(size_t idx, size_t amt, const std::vector<Value>& objects) {
    check_precondition(arranged_content() == content_, "Mutating an arranged ArrayProxy is not allowed");
    replace_content(idx, amt, objects);
}

void ArrayProxy::arranged_content_array_will_change(ObservableArray&, const ArrayChange& change) {
    array_content_will_change(change.start, change.removed, change.added);
}

void ArrayProxy::arranged_content_array_did_change(ObservableArray&, const ArrayChange& change) {
    array_content_did_change(change.start, change.removed, change.added);
}

Value ArrayProxy::object_at_content(size_t idx) const {
    auto* arranged = arranged_content();
    // A view that resolved to the proxy itself was rejected on attach and reads as empty
    return arranged && arranged != this ? arranged->object_at(idx) : Value{};
}

void ArrayProxy::replace_content(size_t idx, size_t amt, const std::vector<Value>& objects) {
    check_precondition(content_ != nullptr, "ArrayProxy has no content to mutate");
    auto* mutable_content = dynamic_cast<MutableArray*>(content_);
    if (mutable_content == nullptr) {
        throw_error<PreconditionViolation>("ArrayProxy content of type {} can not be mutated",
                                           typeid(*content_).name());
    }
    mutable_content->replace(idx, amt, objects);
}

void ArrayProxy::change_arranged_content(const std::function<void()>& store) {
    if (!is_initialised()) {
        // Still being configured, init binds to whatever is in place once construction completes
        store();
        return;
    }
    check_precondition(!is_destroyed() && !is_destroying(), "Can't change the content of a destroyed ArrayProxy");
    check_precondition(!swapping_ && pending_changes_ == 0,
                       "Can't swap ArrayProxy content while a change notification is in progress");

    SwapGuard guard{swapping_};
    arranged_content_will_change();
    store();
    arranged_content_did_change();
}

void ArrayProxy::init() { setup_arranged_content(); }

void ArrayProxy::will_destroy() { teardown_arranged_content(); }

void ArrayProxy::arranged_content_will_change() {
    const size_t len = arranged_length();

    arranged_content_array_will_change(*this, ArrayChange{0, len, std::nullopt});

    teardown_arranged_content();
}

void ArrayProxy::arranged_content_did_change() {
    // Validate and attach before the new length is read
    setup_arranged_content();

    const size_t len = arranged_length();

    arranged_content_array_did_change(*this, ArrayChange{0, std::nullopt, len});
}

size_t ArrayProxy::arranged_length() const {
    auto* arranged = arranged_content();
    return arranged && arranged != this ? arranged->length() : 0;
}

void ArrayProxy::setup_arranged_content() {
    auto* arranged = arranged_content();
    if (arranged == nullptr) { return; }

    check_precondition(arranged != this, "Can't set ArrayProxy's content to itself");
    if (!arranged->is_array() && !arranged->is_destroyed()) {
        throw_error<PreconditionViolation>("ArrayProxy expects an Array or ArrayProxy, but you passed {}",
                                           typeid(*arranged).name());
    }

    arranged->add_array_observer(&forwarder_);
    subscribed_ = arranged;
}

void ArrayProxy::teardown_arranged_content() {
    if (subscribed_ == nullptr) { return; }
    subscribed_->remove_array_observer(&forwarder_);
    subscribed_ = nullptr;
}

void ArrayProxy::ContentForwarder::array_will_change(ObservableArray& source, const ArrayChange& change) {
    ++proxy_.pending_changes_;
    try {
        proxy_.arranged_content_array_will_change(source, change);
    } catch (...) {
        // The matching did-change will not arrive, the mutation is abandoned
        --proxy_.pending_changes_;
        throw;
    }
}

void ArrayProxy::ContentForwarder::array_did_change(ObservableArray& source, const ArrayChange& change) {
    if (proxy_.pending_changes_ > 0) { --proxy_.pending_changes_; }
    proxy_.arranged_content_array_did_change(source, change);
}

}  // namespace arrayproxy
