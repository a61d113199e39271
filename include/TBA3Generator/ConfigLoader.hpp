#pragma once
// ConfigLoader.hpp – Parses the XML configuration files into typed configs.
//
// groups.xml
//   <Groups>
//     <Defaults>
//       <Covariate type="geschlecht">
//         <Category name="m" probability="0.5"/>
//         <Category name="w" probability="0.5"/>
//       </Covariate>
//     </Defaults>
//     <Group id="3a" name="Klasse 3a" booklet="V3-2024-DE-TH01"
//            ability_mean="0.2" ability_std="1.0" size="25" seed="3a-2024"/>
//   </Groups>
//
// schools.xml            <Schools><School id="s1"><Group ref="3a"/>…</School></Schools>
// states.xml             <States><Defaults>…</Defaults>
//                          <State id="BE" ability_mean=… ability_std=… size=… seed=…>
//                            <Booklet ref="V3-2024-DE-TH01"/></State></States>
// equivalence_tables.xml <EquivalenceTables><Table booklet="…" domain="le">
//                          <Level name_short="I" min_score="0" max_score="3"/>…
//                        </Table></EquivalenceTables>
//
// All loaders throw ConfigValidationError on parse or schema failures.
// Cross-entity rules (duplicate ids, table coverage) are checked by ConfigStore.

#include "Config.hpp"

#include <filesystem>

namespace tba3 {

[[nodiscard]] GroupsFile            loadGroupsConfig(const std::filesystem::path& xml_path);
[[nodiscard]] SchoolsFile           loadSchoolsConfig(const std::filesystem::path& xml_path);
[[nodiscard]] StatesFile            loadStatesConfig(const std::filesystem::path& xml_path);
[[nodiscard]] EquivalenceTablesFile loadEquivalenceTables(const std::filesystem::path& xml_path);

} // namespace tba3
