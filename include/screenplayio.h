#pragma once

class QString;
class ScriptDocument;

namespace ScreenplayIO {

// The extension picks the format: .fdx is Final Draft XML, .txt is tagged
// text (or plain screenplay text when it carries no role tags), .fountain is
// plain screenplay text, anything else is the JSON .sqt format.
bool saveDocument(const ScriptDocument &document, const QString &filePath);
bool loadDocument(ScriptDocument &document, const QString &filePath, int &lineCount);

} // namespace ScreenplayIO
