/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#include <qtermdoc/QTermTextEngine.hpp>

#include <wchar.h>

/*
 * Helper functions
 */
static QString rightTrimmed( const QString& str ) {
    int end = str.length();

    while ( end > 0 and str.at( end - 1 ).isSpace() ) {
        end--;
    }

    return str.left( end );
}


static bool endsSentence( const QString& line ) {
    static const QString closers( "\"')]}’”" );
    static const QString terminators( ".!?…" );

    int pos = line.length() - 1;

    while ( pos >= 0 and closers.contains( line.at( pos ) ) ) {
        pos--;
    }

    return pos >= 0 and terminators.contains( line.at( pos ) );
}


static bool endsWithSplitWord( const QString& line ) {
    const int len = line.length();

    if ( len < 2 ) {
        return false;
    }

    return line.at( len - 1 ) == '-' and line.at( len - 2 ).isLetter();
}


/**
 * Group the words of a paragraph into the units wrap() may not break.
 * A word ending in a letter and '-' followed by a word starting with a
 * letter must not end a line, or reflowing would join the two into one
 * word. They stay together when both fit on a line; otherwise the
 * hyphen moves to the start of the next word.
 */
static QStringList breakUnits( QStringList words, int width ) {
    QStringList units;

    for ( int i = 0; i < words.count(); i++ ) {
        QString unit = words.at( i );

        while ( endsWithSplitWord( unit ) and (i + 1 < words.count() ) and words.at( i + 1 ).at( 0 ).isLetter() ) {
            const QString joined = unit + ' ' + words.at( i + 1 );

            if ( QTermTextEngine::displayWidth( joined ) <= width ) {
                unit = joined;
                i++;
                continue;
            }

            unit.chop( 1 );
            words[ i + 1 ].prepend( '-' );
            break;
        }

        units << unit;
    }

    return units;
}


static bool looksPreformatted( const QString& line ) {
    return line.contains( '\t' ) or line.contains( "  " );
}


/* First and last non-blank line of a page */
static int firstContentLine( const QStringList& lines ) {
    for ( int i = 0; i < lines.count(); i++ ) {
        if ( not lines.at( i ).trimmed().isEmpty() ) {
            return i;
        }
    }

    return -1;
}


static int lastContentLine( const QStringList& lines ) {
    for ( int i = lines.count() - 1; i >= 0; i-- ) {
        if ( not lines.at( i ).trimmed().isEmpty() ) {
            return i;
        }
    }

    return -1;
}


/* Collapse runs of blank lines, drop them at both ends */
static QStringList normalizeBlankLines( const QStringList& lines ) {
    QStringList out;

    for ( const QString& line: lines ) {
        if ( line.trimmed().isEmpty() ) {
            if ( out.count() and not out.last().isEmpty() ) {
                out << QString();
            }

            continue;
        }

        out << line;
    }

    while ( out.count() and out.last().isEmpty() ) {
        out.removeLast();
    }

    return out;
}


QTermTextEngine::QTermTextEngine( QTermTextOptions opts ) {
    mOpts           = opts;
    mDoc            = nullptr;
    mGeneration     = 0;
    mFurnitureReady = false;
}


QTermTextOptions QTermTextEngine::options() const {
    QMutexLocker locker( &mLock );

    return mOpts;
}


void QTermTextEngine::setOptions( QTermTextOptions opts ) {
    QMutexLocker locker( &mLock );

    mOpts = opts;

    /** Tokenizing depends on the thresholds, so start over */
    mRawLines.clear();
    mPages.clear();
    mFurnitureReady = false;
    mFurniture      = QTermFurniture();
}


void QTermTextEngine::setDocument( QTermDocument *doc ) {
    QMutexLocker locker( &mLock );

    mDoc        = doc;
    mGeneration = (doc ? doc->generation() : 0);

    mRawLines.clear();
    mPages.clear();
    mFurnitureReady = false;
    mFurniture      = QTermFurniture();
}


void QTermTextEngine::invalidate() {
    QMutexLocker locker( &mLock );

    mGeneration = (mDoc ? mDoc->generation() : 0);

    mRawLines.clear();
    mPages.clear();
    mFurnitureReady = false;
    mFurniture      = QTermFurniture();
}


QTermTextPage QTermTextEngine::textPage( int page ) {
    QMutexLocker locker( &mLock );

    QTermTextPage textPage;

    textPage.page = page;

    if ( not mDoc or mDoc->status() != QTermDocument::Ready ) {
        textPage.reason = "No document loaded";
        return textPage;
    }

    if ( (page < 0) or (page >= mDoc->pageCount() ) ) {
        textPage.reason = QString( "No page %1" ).arg( page + 1 );
        return textPage;
    }

    /** The document was reloaded behind our back */
    if ( mDoc->generation() != mGeneration ) {
        mGeneration = mDoc->generation();
        mRawLines.clear();
        mPages.clear();
        mFurnitureReady = false;
        mFurniture      = QTermFurniture();
    }

    if ( mPages.contains( page ) ) {
        return mPages.value( page );
    }

    textPage.generation = mGeneration;
    textPage.rawLines   = rawLines( page );

    if ( firstContentLine( textPage.rawLines ) < 0 ) {
        textPage.status = QTermTextPage::NoExtractableText;
        textPage.reason = "No extractable text on this page";
        textPage.rawLines.clear();
    }

    else {
        QStringList lines = textPage.rawLines;

        if ( mOpts.trimFurniture ) {
            lines = stripFurniture( lines, furniture() );
        }

        /** Nothing but a running header or footer */
        if ( firstContentLine( lines ) < 0 ) {
            textPage.status = QTermTextPage::NoExtractableText;
            textPage.reason = "Only running headers or footers on this page";
        }

        else {
            textPage.status     = QTermTextPage::Ok;
            textPage.paragraphs = reflow( lines );
        }
    }

    mPages[ page ] = textPage;

    return textPage;
}


bool QTermTextEngine::isCached( int page ) const {
    QMutexLocker locker( &mLock );

    return mPages.contains( page );
}


QStringList QTermTextEngine::rawLines( int page ) {
    if ( mRawLines.contains( page ) ) {
        return mRawLines.value( page );
    }

    QStringList lines = tokenize( mDoc->pageTextOps( page ), mOpts );

    mRawLines[ page ] = lines;

    return lines;
}


QTermFurniture QTermTextEngine::furniture() {
    if ( mFurnitureReady ) {
        return mFurniture;
    }

    QList<QStringList> samples;
    const int          count = qMin( mOpts.samplePages, mDoc->pageCount() );

    for ( int pg = 0; pg < count; pg++ ) {
        samples << rawLines( pg );
    }

    mFurniture      = detectFurniture( samples, mOpts );
    mFurnitureReady = true;

    if ( not mFurniture.isEmpty() ) {
        qDebug() << "Page furniture:" << mFurniture.headers.values() << mFurniture.footers.values();
    }

    return mFurniture;
}


QStringList QTermTextEngine::tokenize( const QTermTextOps& ops, const QTermTextOptions& opts ) {
    QStringList lines;
    QString     current;

    for ( const QTermTextOp& op: ops ) {
        const bool lineBreak = op.newline or (op.translation.y() > opts.lineTolerance);

        if ( lineBreak ) {
            lines << rightTrimmed( current );
            current.clear();
        }

        /** Only an intentional gap becomes a space; adjacency alone does not */
        else if ( (op.spacing < -opts.wordSpaceThreshold) and current.length() ) {
            if ( not current.at( current.length() - 1 ).isSpace() and not op.text.startsWith( ' ' ) ) {
                current += ' ';
            }
        }

        /** Fragments may carry their own line feeds */
        const QStringList parts = op.text.split( '\n' );

        for ( int i = 0; i < parts.count(); i++ ) {
            if ( i > 0 ) {
                lines << rightTrimmed( current );
                current.clear();
            }

            current += QString( parts.at( i ) ).remove( '\r' );
        }
    }

    lines << rightTrimmed( current );

    return normalizeBlankLines( lines );
}


QTermFurniture QTermTextEngine::detectFurniture( const QList<QStringList>& samples, const QTermTextOptions& opts ) {
    QTermFurniture furniture;

    /** We need at least two pages to call anything repeated */
    if ( samples.count() < 2 ) {
        return furniture;
    }

    QHash<QString, int> tops;
    QHash<QString, int> bottoms;

    for ( const QStringList& lines: samples ) {
        const int first = firstContentLine( lines );
        const int last  = lastContentLine( lines );

        if ( first < 0 ) {
            continue;
        }

        tops[ lines.at( first ).trimmed() ]++;

        if ( last != first ) {
            bottoms[ lines.at( last ).trimmed() ]++;
        }
    }

    const qreal threshold = opts.furnitureRatio * samples.count();

    for ( auto it = tops.cbegin(); it != tops.cend(); ++it ) {
        if ( (it.value() >= 2) and (it.value() > threshold) ) {
            furniture.headers << it.key();
        }
    }

    for ( auto it = bottoms.cbegin(); it != bottoms.cend(); ++it ) {
        if ( (it.value() >= 2) and (it.value() > threshold) ) {
            furniture.footers << it.key();
        }
    }

    return furniture;
}


QStringList QTermTextEngine::stripFurniture( QStringList lines, const QTermFurniture& furniture ) {
    if ( furniture.isEmpty() ) {
        return lines;
    }

    const int first = firstContentLine( lines );

    if ( (first >= 0) and furniture.headers.contains( lines.at( first ).trimmed() ) ) {
        lines.removeAt( first );
    }

    const int last = lastContentLine( lines );

    if ( (last >= 0) and furniture.footers.contains( lines.at( last ).trimmed() ) ) {
        lines.removeAt( last );
    }

    return normalizeBlankLines( lines );
}


QStringList QTermTextEngine::reflow( const QStringList& lines ) {
    QStringList paragraphs;
    QString     current;
    bool        open = false;

    for ( const QString& line: lines ) {
        const QString text = line.trimmed();

        /** Blank line: hard break, never joined across */
        if ( text.isEmpty() ) {
            if ( open ) {
                paragraphs << current;
                current.clear();
                open = false;
            }

            if ( paragraphs.count() and not paragraphs.last().isEmpty() ) {
                paragraphs << QString();
            }

            continue;
        }

        if ( not open ) {
            current = text;
            open    = true;
            continue;
        }

        /** exam- / ple -> example */
        if ( endsWithSplitWord( current ) and text.at( 0 ).isLetter() ) {
            current.chop( 1 );
            current += text;
            continue;
        }

        if ( not endsSentence( current ) and text.at( 0 ).isLower() ) {
            current += ' ';
            current += text;
            continue;
        }

        paragraphs << current;
        current = text;
    }

    if ( open ) {
        paragraphs << current;
    }

    while ( paragraphs.count() and paragraphs.last().isEmpty() ) {
        paragraphs.removeLast();
    }

    return paragraphs;
}


QStringList QTermTextEngine::wrap( const QString& text, int width ) {
    if ( width <= 0 ) {
        return QStringList() << text;
    }

    QStringList lines;
    QString     current;
    int         currentWidth = 0;

    const QStringList words = breakUnits( text.split( QRegularExpression( "\\s+" ), Qt::SkipEmptyParts ), width );

    for ( const QString& word: words ) {
        const int wordWidth = displayWidth( word );
        const int sepWidth  = (current.isEmpty() ? 0 : 1);

        if ( currentWidth + sepWidth + wordWidth <= width ) {
            if ( current.length() ) {
                current += ' ';
                currentWidth++;
            }

            current      += word;
            currentWidth += wordWidth;
            continue;
        }

        if ( current.length() ) {
            lines << current;
            current.clear();
            currentWidth = 0;
        }

        if ( wordWidth <= width ) {
            current      = word;
            currentWidth = wordWidth;
            continue;
        }

        /** Longer than a line: cut it, the tail stays open for the next word */
        const QVector<uint> ucs4 = word.toUcs4();

        for ( uint cp: ucs4 ) {
            const QString ch = QString::fromUcs4( &cp, 1 );
            const int     w  = displayWidth( ch );

            if ( (currentWidth + w > width) and current.length() ) {
                /** Never leave "post-" above "war": the hyphen goes down with the word */
                if ( endsWithSplitWord( current ) and ch.at( 0 ).isLetter() ) {
                    current.chop( 1 );
                    lines << current;

                    current      = "-";
                    currentWidth = 1;

                    if ( currentWidth + w > width ) {
                        lines << current;
                        current.clear();
                        currentWidth = 0;
                    }
                }

                else {
                    lines << current;
                    current.clear();
                    currentWidth = 0;
                }
            }

            current      += ch;
            currentWidth += w;
        }
    }

    if ( current.length() ) {
        lines << current;
    }

    if ( lines.isEmpty() ) {
        lines << QString();
    }

    return lines;
}


QStringList QTermTextEngine::wrapParagraphs( const QStringList& paragraphs, int width ) {
    QStringList out;

    for ( const QString& para: paragraphs ) {
        if ( para.isEmpty() ) {
            out << QString();
            continue;
        }

        out << wrap( para, width );
    }

    return out;
}


QStringList QTermTextEngine::wrapLines( const QStringList& lines, int width ) {
    QStringList out;

    for ( const QString& line: lines ) {
        if ( line.trimmed().isEmpty() ) {
            out << QString();
            continue;
        }

        if ( looksPreformatted( line ) ) {
            out << line;
            continue;
        }

        out << wrap( line, width );
    }

    while ( out.count() and out.last().isEmpty() ) {
        out.removeLast();
    }

    return out;
}


QStringList QTermTextEngine::layout( const QTermTextPage& page, TextMode mode, int width ) {
    if ( page.status != QTermTextPage::Ok ) {
        return QStringList();
    }

    switch ( mode ) {
        case Raw: {
            return page.rawLines;
        }

        case Wrap: {
            return wrapLines( page.rawLines, width );
        }

        case Reflow: {
            return wrapParagraphs( page.paragraphs, width );
        }
    }

    return QStringList();
}


int QTermTextEngine::displayWidth( const QString& str ) {
    int width = 0;

    for ( uint cp: str.toUcs4() ) {
        const int w = wcwidth( (wchar_t)cp );

        if ( w >= 0 ) {
            width += w;
            continue;
        }

        /** Unknown to the C library (C locale): count printable characters as one cell */
        const QChar::Category cat = QChar::category( cp );

        if ( (cat == QChar::Mark_NonSpacing) or (cat == QChar::Mark_Enclosing) or (cat == QChar::Other_Control) ) {
            continue;
        }

        width++;
    }

    return width;
}


QString QTermTextEngine::modeName( TextMode mode ) {
    switch ( mode ) {
        case Raw: {
            return "raw";
        }

        case Wrap: {
            return "wrap";
        }

        case Reflow: {
            return "reflow";
        }
    }

    return "reflow";
}


QTermTextEngine::TextMode QTermTextEngine::modeFromName( QString name, TextMode fallback ) {
    name = name.trimmed().toLower();

    if ( name == "raw" ) {
        return Raw;
    }

    if ( name == "wrap" ) {
        return Wrap;
    }

    if ( name == "reflow" ) {
        return Reflow;
    }

    return fallback;
}
