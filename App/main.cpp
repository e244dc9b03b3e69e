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

#include <QtCore>
#include <QtGui/QImage>

#include <qtermdoc/PopplerDocument.hpp>
#include <qtermdoc/QTermRenderer.hpp>
#include <qtermdoc/QTermSink.hpp>
#include <qtermdoc/QTermTerminal.hpp>
#include <qtermdoc/QTermTextEngine.hpp>
#include <qtermdoc/QTermView.hpp>
#include <qtermdoc/QTermViewerOptions.hpp>
#include <qtermdoc/QTermViewport.hpp>

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#ifndef QTERMDOC_VERSION
#define QTERMDOC_VERSION "1.0.0"
#endif

static QFile *logFile     = nullptr;
static bool  debugEnabled = false;

/*
 * The terminal belongs to the view: every message goes to the log file
 */
static void messageHandler( QtMsgType type, const QMessageLogContext&, const QString& msg ) {
    if ( (type == QtDebugMsg) and not debugEnabled ) {
        return;
    }

    const char *level = "";

    switch ( type ) {
        case QtDebugMsg: {
            level = "debug";
            break;
        }

        case QtInfoMsg: {
            level = "info";
            break;
        }

        case QtWarningMsg: {
            level = "warning";
            break;
        }

        case QtCriticalMsg: {
            level = "critical";
            break;
        }

        case QtFatalMsg: {
            level = "fatal";
            break;
        }
    }

    const QByteArray line = QString( "%1 [%2] %3\n" )
                               .arg( QDateTime::currentDateTime().toString( Qt::ISODateWithMs ) )
                               .arg( level )
                               .arg( msg ).toUtf8();

    if ( logFile and logFile->isOpen() ) {
        logFile->write( line );
        logFile->flush();
    }

    if ( type == QtFatalMsg ) {
        abort();
    }
}


static void installLogging( const QString& path ) {
    debugEnabled = qEnvironmentVariableIsSet( "QTERMDOC_DEBUG" );

    QDir().mkpath( QFileInfo( path ).absolutePath() );

    logFile = new QFile( path );

    if ( not logFile->open( QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text ) ) {
        fprintf( stderr, "qtermdoc: unable to open the log file %s\n", qPrintable( path ) );
        delete logFile;
        logFile = nullptr;

        return;
    }

    qInstallMessageHandler( messageHandler );
}


/* Settings group remembering where we left @path */
static QString progressGroup( const QString& path ) {
    const QByteArray hash = QCryptographicHash::hash( QFileInfo( path ).absoluteFilePath().toUtf8(), QCryptographicHash::Sha1 );

    return "progress/" + QString::fromLatin1( hash.toHex() );
}


static QString errorString( QTermDocument::Error error ) {
    switch ( error ) {
        case QTermDocument::NoError: {
            return "no error";
        }

        case QTermDocument::FileNotFoundError: {
            return "file not found";
        }

        case QTermDocument::InvalidFileFormatError: {
            return "not a valid PDF document";
        }

        case QTermDocument::IncorrectPasswordError: {
            return "the document is locked; a correct password is needed";
        }

        case QTermDocument::UnknownError: {
            return "unknown error";
        }
    }

    return "unknown error";
}


/*
 * One frame of @page written straight to stdout, line by line
 */
static int printPage( QTermDocument *doc, int page, const QTermViewerOptions& opts, QSize frame ) {
    QTextStream out( stdout );

    if ( opts.viewMode == QTermViewerOptions::TextView ) {
        QTermTextEngine engine( opts.text );

        engine.setDocument( doc );

        const QTermTextPage textPage = engine.textPage( page );

        if ( textPage.status != QTermTextPage::Ok ) {
            for ( const QString& line: QTermSink::placeholder( frame.width(), 5, textPage.reason ) ) {
                out << line << "\n";
            }

            return 0;
        }

        for ( const QString& line: QTermTextEngine::layout( textPage, opts.textMode, frame.width() ) ) {
            out << line << "\n";
        }

        return 0;
    }

    /** Two pixels per cell vertically, one horizontally */
    const QSize cellPx( 1, 2 );

    QTermViewportState state;

    state.zoomPercent = opts.zoomPercent;
    state.frameCols   = frame.width();
    state.frameRows   = frame.height();

    const QTermRenderRequest req = QTermViewport::renderRequest( page, doc->pageSize( page ), state, cellPx, opts.limits, opts.colorMode );

    QTermRenderOptions renderOpts;

    renderOpts.setColorMode( opts.colorMode );

    const QImage bitmap = doc->renderPage( req.page, QSize( req.width, req.height ), renderOpts );

    if ( bitmap.isNull() ) {
        qCritical() << "Page" << page + 1 << "could not be rendered";

        for ( const QString& line: QTermSink::placeholder( frame.width(), 5, QString( "Page %1 could not be rendered" ).arg( page + 1 ) ) ) {
            out << line << "\n";
        }

        return 1;
    }

    const QTermPlacement placement = QTermViewport::place( bitmap.size(), state, cellPx, opts.limits.maxTransmitPixels );

    QImage buffer = bitmap.copy( placement.cropRect );

    if ( placement.isDownscaled() ) {
        buffer = buffer.scaled( placement.transmitSize, Qt::IgnoreAspectRatio, Qt::SmoothTransformation );
    }

    const QString margin( placement.targetCells.x(), QChar( ' ' ) );

    for ( const QString& row: QTermBlockSink::halfBlocks( buffer, placement.targetCells.size() ) ) {
        out << margin << row << "\n";
    }

    return 0;
}


int main( int argc, char *argv[] ) {
    QCoreApplication app( argc, argv );

    app.setApplicationName( "qtermdoc" );
    app.setApplicationVersion( QTERMDOC_VERSION );

    QCommandLineParser parser;

    parser.setApplicationDescription( "Read PDF documents inside the terminal" );
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addPositionalArgument( "document", "PDF document to open" );

    QCommandLineOption pageOpt( "page", "Open at page <n> (1-based).", "n" );
    QCommandLineOption modeOpt( "mode", "Start in <mode>: image or text.", "mode" );
    QCommandLineOption textModeOpt( "text-mode", "Text layout: raw, wrap or reflow.", "layout" );
    QCommandLineOption zoomOpt( "zoom", "Initial zoom in percent.", "percent" );
    QCommandLineOption qualityOpt( "quality", "Image quality: fast, balanced or sharp.", "preset" );
    QCommandLineOption configOpt( "config", "Read settings from <file>.", "file" );
    QCommandLineOption logOpt( "log", "Append log messages to <file>.", "file" );
    QCommandLineOption passwordOpt( "password", "Password of a locked document.", "password" );
    QCommandLineOption printOpt( "print", "Print one frame of the page to stdout and exit." );
    QCommandLineOption noKittyOpt( "no-kitty", "Never use the kitty graphics protocol." );

    parser.addOptions( { pageOpt, modeOpt, textModeOpt, zoomOpt, qualityOpt, configOpt, logOpt, passwordOpt, printOpt, noKittyOpt } );

    parser.process( app );

    if ( parser.positionalArguments().count() != 1 ) {
        parser.showHelp( 1 );
    }

    const QString docPath = parser.positionalArguments().at( 0 );

    QString logPath = parser.value( logOpt );

    if ( logPath.isEmpty() ) {
        logPath = QStandardPaths::writableLocation( QStandardPaths::CacheLocation ) + "/qtermdoc.log";
    }

    installLogging( logPath );

    QString configPath = parser.value( configOpt );

    if ( configPath.isEmpty() ) {
        configPath = QStandardPaths::writableLocation( QStandardPaths::GenericConfigLocation ) + "/qtermdoc/qtermdoc.conf";
    }

    QSettings settings( configPath, QSettings::IniFormat );

    QTermViewerOptions opts = QTermViewerOptions::fromSettings( settings );

    /** Where we left this document last time */
    const QString progress = progressGroup( docPath );
    int           page     = settings.value( progress + "/page", 0 ).toInt();

    opts.viewMode = QTermViewerOptions::viewModeFromName( settings.value( progress + "/mode" ).toString(), opts.viewMode );

    if ( parser.isSet( qualityOpt ) ) {
        opts.applyQuality( QTermViewerOptions::qualityFromName( parser.value( qualityOpt ), opts.quality ) );
    }

    if ( parser.isSet( modeOpt ) ) {
        opts.viewMode = QTermViewerOptions::viewModeFromName( parser.value( modeOpt ), opts.viewMode );
    }

    if ( parser.isSet( textModeOpt ) ) {
        opts.textMode = QTermTextEngine::modeFromName( parser.value( textModeOpt ), opts.textMode );
    }

    if ( parser.isSet( zoomOpt ) ) {
        opts.zoomPercent = parser.value( zoomOpt ).toInt();
    }

    if ( parser.isSet( pageOpt ) ) {
        page = parser.value( pageOpt ).toInt() - 1;
    }

    opts.normalize();

    qInfo() << "Opening" << docPath << "with" << QTermViewerOptions::qualityName( opts.quality ) << "quality";

    PopplerDocument doc( docPath );

    doc.load();

    if ( doc.passwordNeeded() and parser.isSet( passwordOpt ) ) {
        doc.setPassword( parser.value( passwordOpt ) );
    }

    if ( doc.status() != QTermDocument::Ready ) {
        qCritical() << "Unable to open" << docPath << doc.error();
        fprintf( stderr, "qtermdoc: %s: %s\n", qPrintable( docPath ), qPrintable( errorString( doc.error() ) ) );

        return 1;
    }

    page = qBound( 0, page, doc.pageCount() - 1 );

    QTermTerminal term( STDIN_FILENO, STDOUT_FILENO );

    if ( parser.isSet( printOpt ) ) {
        const QSize size = term.size();

        return printPage( &doc, page, opts, QSize( size.width(), qMax( 1, size.height() - 1 ) ) );
    }

    doc.setWatchFile( opts.watchFile );

    QTermRenderer renderer( opts );

    renderer.setDocument( &doc );
    renderer.setPage( page );

    QTermView view( &term, &renderer );

    view.setForceBlocks( parser.isSet( noKittyOpt ) );

    int exitCode = 0;

    QObject::connect( &view, &QTermView::finished, &app, &QCoreApplication::quit );
    QObject::connect(
        &renderer, &QTermRenderer::documentFailed, [ &view, &app, &exitCode, &docPath ] ( QTermDocument::Error error ) {
            view.stop();
            fprintf( stderr, "qtermdoc: %s: %s\n", qPrintable( docPath ), qPrintable( errorString( error ) ) );
            exitCode = 1;
            app.quit();
        }
    );

    if ( not view.start() ) {
        fprintf( stderr, "qtermdoc: unable to set up the terminal\n" );
        return 1;
    }

    const int ret = app.exec();

    view.stop();

    /** Remember where we were */
    settings.setValue( progress + "/page", renderer.currentPage() );
    settings.setValue( progress + "/mode", QTermViewerOptions::viewModeName( renderer.viewMode() ) );
    settings.setValue( progress + "/path", QFileInfo( docPath ).absoluteFilePath() );
    settings.sync();

    if ( settings.status() != QSettings::NoError ) {
        qWarning() << "Unable to save the reading progress to" << settings.fileName();
    }

    return (exitCode ? exitCode : ret);
}
