#include "generator/component.hpp"

namespace rustisan::generator {

ComponentSpec spec_from_descriptor(ComponentKind kind, const cli::CommandDescriptor& descriptor) {
    ComponentSpec spec;
    spec.kind = kind;
    spec.name = descriptor.arg(0).value_or("");

    Modifiers& m = spec.modifiers;
    m.resource = descriptor.flag_bool("resource");
    m.api = descriptor.flag_bool("api");
    m.migration = descriptor.flag_bool("migration");
    m.factory = descriptor.flag_bool("factory");
    m.seeder = descriptor.flag_bool("seeder");
    m.collection = descriptor.flag_bool("collection");
    m.sync = descriptor.flag_bool("sync");
    m.unit = descriptor.flag_bool("unit");
    m.integration = descriptor.flag_bool("integration");
    m.force = descriptor.flag_bool("force");

    m.model = descriptor.flag("model").value_or("");
    m.event = descriptor.flag("event").value_or("");
    m.create_table = descriptor.flag("create").value_or("");
    m.modify_table = descriptor.flag("table").value_or("");
    return spec;
}

} // namespace rustisan::generator
