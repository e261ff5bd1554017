#include "librtlife/lifestyle.hpp"
#include "librtlife/exceptions.hpp"

#include <algorithm>
#include <utility>

namespace librtlife {

namespace {

/// Shared state of the two hybrid variants.  Both inner registrations are
/// built up front; each call only evaluates the selector and delegates.
struct hybrid_parts {
    std::function<bool()> selector;
    std::shared_ptr<const lifestyle> true_lifestyle;
    std::shared_ptr<const lifestyle> false_lifestyle;

    std::string name() const {
        return "Hybrid " + true_lifestyle->name() + " / " + false_lifestyle->name();
    }

    int component_length() const {
        return std::max(true_lifestyle->component_length(),
                        false_lifestyle->component_length());
    }

    int dependency_length() const {
        return std::min(true_lifestyle->dependency_length(),
                        false_lifestyle->dependency_length());
    }
};

template <typename Inner>
void require_parts(const std::function<bool()>& selector,
                   const std::shared_ptr<Inner>& true_lifestyle,
                   const std::shared_ptr<Inner>& false_lifestyle) {
    if (!selector) {
        throw argument_error("lifestyle_selector", "lifestyle selector cannot be empty");
    }
    if (!true_lifestyle) {
        throw argument_error("true_lifestyle", "lifestyle cannot be null");
    }
    if (!false_lifestyle) {
        throw argument_error("false_lifestyle", "lifestyle cannot be null");
    }
}

/// Builds the delegating factory.  `create_inner` runs each inner
/// lifestyle's core once.
template <typename CreateInner>
registration::factory_applier make_hybrid_applier(const hybrid_parts& parts,
                                                  const registration_request& request,
                                                  CreateInner create_inner) {
    return [&parts, &request, create_inner](instance_factory guarded) -> instance_factory {
        registration_request inner_request = request;
        inner_request.raw_factory = std::move(guarded);

        std::shared_ptr<registration> when_true =
            create_inner(*parts.true_lifestyle, inner_request);
        std::shared_ptr<registration> when_false =
            create_inner(*parts.false_lifestyle, inner_request);

        return [selector = parts.selector, when_true, when_false]() {
            return selector() ? when_true->create_instance()
                              : when_false->create_instance();
        };
    };
}

class hybrid_lifestyle final : public lifestyle {
public:
    explicit hybrid_lifestyle(hybrid_parts parts)
        : lifestyle(parts.name())
        , parts_(std::move(parts))
    {}

    int component_length() const override { return parts_.component_length(); }
    int dependency_length() const override { return parts_.dependency_length(); }

protected:
    int length() const override { return parts_.dependency_length(); }

    std::shared_ptr<registration> create_registration_core(
            const registration_request& request) const override {
        return make_registration(request, make_hybrid_applier(parts_, request,
            [](const lifestyle& inner, const registration_request& r) {
                return create_inner_registration(inner, r);
            }));
    }

private:
    hybrid_parts parts_;
};

class scoped_hybrid_lifestyle final : public scoped_lifestyle {
public:
    scoped_hybrid_lifestyle(hybrid_parts parts,
                            std::shared_ptr<const scoped_lifestyle> when_true,
                            std::shared_ptr<const scoped_lifestyle> when_false)
        : scoped_lifestyle(parts.name())
        , parts_(std::move(parts))
        , true_scoped_(std::move(when_true))
        , false_scoped_(std::move(when_false))
    {}

    int component_length() const override { return parts_.component_length(); }
    int dependency_length() const override { return parts_.dependency_length(); }

    scope* current_scope(const container& owner) const override {
        return parts_.selector() ? true_scoped_->current_scope(owner)
                                 : false_scoped_->current_scope(owner);
    }

protected:
    int length() const override { return parts_.dependency_length(); }

    std::shared_ptr<registration> create_registration_core(
            const registration_request& request) const override {
        return make_registration(request, make_hybrid_applier(parts_, request,
            [](const lifestyle& inner, const registration_request& r) {
                return create_inner_registration(inner, r);
            }));
    }

private:
    hybrid_parts parts_;
    std::shared_ptr<const scoped_lifestyle> true_scoped_;
    std::shared_ptr<const scoped_lifestyle> false_scoped_;
};

} // namespace

std::shared_ptr<const lifestyle> lifestyle::create_hybrid(
        std::function<bool()> lifestyle_selector,
        std::shared_ptr<const lifestyle> true_lifestyle,
        std::shared_ptr<const lifestyle> false_lifestyle) {
    require_parts(lifestyle_selector, true_lifestyle, false_lifestyle);
    return std::make_shared<hybrid_lifestyle>(hybrid_parts{
        std::move(lifestyle_selector), std::move(true_lifestyle), std::move(false_lifestyle)});
}

std::shared_ptr<const scoped_lifestyle> lifestyle::create_scoped_hybrid(
        std::function<bool()> lifestyle_selector,
        std::shared_ptr<const scoped_lifestyle> true_lifestyle,
        std::shared_ptr<const scoped_lifestyle> false_lifestyle) {
    require_parts(lifestyle_selector, true_lifestyle, false_lifestyle);
    hybrid_parts parts{lifestyle_selector, true_lifestyle, false_lifestyle};
    return std::make_shared<scoped_hybrid_lifestyle>(
        std::move(parts), std::move(true_lifestyle), std::move(false_lifestyle));
}

} // namespace librtlife
