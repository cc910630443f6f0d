#include "runtime/binding.hpp"

namespace carp::runtime {

auto InterfaceBinding::find(const ExternalName& call) const -> const CallBinding* {
    for (const auto& binding : calls) {
        if (binding.name == call) {
            return &binding;
        }
    }
    return nullptr;
}

namespace {

class RecordBuilder : public ResponseBuilder {
public:
    void put(const ExternalName& field, std::any value) {
        record_.insert_or_assign(field, std::move(value));
    }

    auto complete() -> std::any override {
        return std::move(record_);
    }

private:
    codec::Record record_;
};

} // namespace

auto record_response(ExternalName variant, const std::vector<ExternalName>& fields)
    -> ResponseBinding {
    ResponseBinding binding{std::move(variant), [] { return std::any(codec::Record{}); }, {}};
    for (const auto& field : fields) {
        binding.fields.push_back(FieldBinding{
            field,
            [field](std::any value) -> Box<ResponseBuilder> {
                auto builder = make_box<RecordBuilder>();
                builder->put(field, std::move(value));
                return builder;
            },
            [field](ResponseBuilder& builder, std::any value) {
                static_cast<RecordBuilder&>(builder).put(field, std::move(value));
            }});
    }
    return binding;
}

} // namespace carp::runtime
