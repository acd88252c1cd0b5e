#include "report_io.hpp"

#include <algorithm>
#include <fstream>
#include <map>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"

using namespace std;

namespace retreat_placer {

namespace {

struct CsvTable {
    map<string, int> column;
    vector<vector<string>> rows;
};

absl::StatusOr<CsvTable> ReadCsv(const string& path, const vector<string>& required) {
    ifstream in(path);
    if (!in) return absl::InvalidArgumentError(absl::StrFormat("Cannot open '%s'", path));

    CsvTable table;
    string line;
    bool header = true;
    while (getline(in, line)) {
        absl::string_view view(line);
        absl::ConsumeSuffix(&view, "\r");
        if (header) {
            absl::ConsumePrefix(&view, "\xEF\xBB\xBF");  // UTF-8 BOM
            vector<string> names = SplitCsvLine(string(view));
            for (size_t i = 0; i < names.size(); ++i) {
                table.column[string(absl::StripAsciiWhitespace(names[i]))] = static_cast<int>(i);
            }
            header = false;
            continue;
        }
        if (absl::StripAsciiWhitespace(view).empty()) continue;
        table.rows.push_back(SplitCsvLine(string(view)));
    }
    if (header) return absl::InvalidArgumentError(absl::StrFormat("'%s' is empty", path));

    for (const string& name : required) {
        if (table.column.count(name) == 0) {
            return absl::InvalidArgumentError(
                absl::StrFormat("'%s' is missing column '%s'", path, name));
        }
    }
    return table;
}

string Cell(const CsvTable& table, const vector<string>& row, const string& name) {
    const int i = table.column.at(name);
    return i < static_cast<int>(row.size()) ? row[i] : "";
}

string CsvField(const string& value) {
    if (value.find_first_of(",\"\n") == string::npos) return value;
    string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

void WriteRow(ofstream& out, const vector<string>& fields) {
    vector<string> escaped;
    escaped.reserve(fields.size());
    for (const string& f : fields) escaped.push_back(CsvField(f));
    out << absl::StrJoin(escaped, ",") << "\n";
}

}  // namespace

vector<string> SplitCsvLine(const string& line) {
    vector<string> fields;
    string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(current);
    return fields;
}

absl::StatusOr<vector<RawRoomRecord>> ReadRoomCsv(const string& path) {
    absl::StatusOr<CsvTable> table = ReadCsv(
        path, {"BuildingName", "RoomName", "RoomFloor", "#BottomBunk", "#TopBunk"});
    if (!table.ok()) return table.status();

    vector<RawRoomRecord> records;
    for (const auto& row : table->rows) {
        records.push_back({Cell(*table, row, "BuildingName"), Cell(*table, row, "RoomName"),
                           Cell(*table, row, "RoomFloor"), Cell(*table, row, "#BottomBunk"),
                           Cell(*table, row, "#TopBunk")});
    }
    return records;
}

absl::StatusOr<vector<RawPersonRecord>> ReadPeopleCsv(const string& path) {
    absl::StatusOr<CsvTable> table = ReadCsv(
        path, {"FirstName", "LastName", "OrgName", "GroupName", "AttachName",
               "RoomLocationPref", "BunkPref"});
    if (!table.ok()) return table.status();

    vector<RawPersonRecord> records;
    for (const auto& row : table->rows) {
        records.push_back({Cell(*table, row, "FirstName"), Cell(*table, row, "LastName"),
                           Cell(*table, row, "OrgName"), Cell(*table, row, "GroupName"),
                           Cell(*table, row, "AttachName"), Cell(*table, row, "RoomLocationPref"),
                           Cell(*table, row, "BunkPref")});
    }
    return records;
}

absl::Status WriteReport(const string& dir, const PlacementReport& report) {
    const string base = dir.empty() ? "." : dir;

    ofstream placed(base + "/FilledRoomMap.csv");
    if (!placed) return absl::InvalidArgumentError(absl::StrFormat("Cannot write into '%s'", base));
    WriteRow(placed, {"BuildingName", "RoomName", "FirstName", "LastName", "OrgName", "GroupName",
                      "RoomFloor", "Bunk", "AttachName", "AttachResolved"});
    vector<PlacementRecord> rows = report.outcome.placements;
    stable_sort(rows.begin(), rows.end(), [](const PlacementRecord& a, const PlacementRecord& b) {
        if (a.building != b.building) return a.building < b.building;
        if (a.room_name != b.room_name) return a.room_name < b.room_name;
        return a.tier == BunkTier::kBottom && b.tier == BunkTier::kTop;
    });
    for (const PlacementRecord& r : rows) {
        const Person& p = report.people[r.person];
        WriteRow(placed, {r.building, r.room_name, p.first_name, p.last_name, p.org, p.group,
                          absl::StrFormat("%d", r.floor), BunkTierName(r.tier), p.attach_text,
                          r.attach_resolved});
    }

    ofstream unplaced(base + "/Unplaced.csv");
    if (!unplaced) return absl::InvalidArgumentError(absl::StrFormat("Cannot write into '%s'", base));
    WriteRow(unplaced, {"FirstName", "LastName", "OrgName", "GroupName", "AttachName",
                        "AttachResolved", "RoomLocationPref", "BunkPref", "Reasons"});
    for (const UnplacedRecord& r : report.outcome.unplaced) {
        const Person& p = report.people[r.person];
        WriteRow(unplaced, {p.first_name, p.last_name, p.org, p.group, p.attach_text,
                            r.attach_resolved, p.needs_floor_one ? "1" : "Any",
                            p.needs_bottom_bunk ? "Bottom" : "Any",
                            absl::StrJoin(r.reasons, "; ")});
    }

    ofstream warnings(base + "/AttachWarnings.csv");
    if (!warnings) return absl::InvalidArgumentError(absl::StrFormat("Cannot write into '%s'", base));
    WriteRow(warnings, {"Person", "AttachName Value", "Stage", "Resolution"});
    for (const AttachAuditEntry& e : report.resolution.audit) {
        string message = e.message;
        if (!e.notes.empty()) message = absl::StrJoin(e.notes, "; ") + "; " + message;
        WriteRow(warnings, {report.people[e.person].FullName(), e.attach_text,
                            ResolutionStageName(e.stage), message});
    }

    if (!placed.good() || !unplaced.good() || !warnings.good()) {
        return absl::DataLossError(absl::StrFormat("Failed writing report files into '%s'", base));
    }
    return absl::OkStatus();
}

void PrintSummary(ostream& out, const PlacementReport& report) {
    const PlacementSummary& s = report.outcome.summary;
    const string rule(70, '=');
    out << rule << "\nRETREAT PLACEMENT RESULTS (" << SolveStatusName(report.status) << ")\n"
        << rule << "\n";
    out << "  Total bed slots : " << s.total_slots << " (bottom " << s.bottom_slots << ", top "
        << s.top_slots << ")\n";
    out << "  People placed   : " << s.placed << "\n";
    out << "  People unplaced : " << s.unplaced << "\n";

    if (!s.placed_by_building.empty()) {
        out << "\n  By building:\n";
        for (const auto& entry : s.placed_by_building) {
            out << "    " << entry.first << ": " << entry.second << "\n";
        }
        out << "\n  Org-Building distribution:\n";
        for (const auto& org : s.placed_by_org_building) {
            vector<string> parts;
            for (const auto& b : org.second) parts.push_back(absl::StrFormat("%s:%d", b.first, b.second));
            out << "    " << (org.first.empty() ? "(no org)" : org.first) << ": "
                << absl::StrJoin(parts, ", ") << "\n";
        }
    }

    if (report.outcome.unplaced.empty()) {
        out << "\n  All people placed successfully!\n";
    } else {
        out << "\n" << string(70, '-') << "\nUNPLACED PEOPLE\n" << string(70, '-') << "\n";
        for (const UnplacedRecord& r : report.outcome.unplaced) {
            const Person& p = report.people[r.person];
            out << "\n  " << p.FullName() << "  (Org=" << p.org << ", Group=" << p.group
                << ", Attach=" << p.attach_text
                << ", FloorPref=" << (p.needs_floor_one ? "1" : "Any")
                << ", BunkPref=" << (p.needs_bottom_bunk ? "Bottom" : "Any") << ")\n";
            for (const string& reason : r.reasons) out << "    -> " << reason << "\n";
        }
    }
    out << rule << "\n";
}

}  // namespace retreat_placer
